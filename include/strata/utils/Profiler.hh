#pragma once

// Tracy instrumentation for chunk shading. Built with STRATA_ENABLE_PROFILING,
// the macros below expand to Tracy zones and plots; otherwise they vanish.
//
//   STRATA_ZONE_SCOPED_N("ChunkPipeline::shadeForward");
//   STRATA_ZONE_PASS(shadingPassName(key.pass));  // tag the zone with the pass
//   STRATA_ZONE_BATCH(begin, end);                // one zone per parallel batch

#ifdef STRATA_PROFILING_ENABLED
#include <tracy/Tracy.hpp>

#include <cstdint>
#include <cstring>

#define STRATA_ZONE_SCOPED ZoneScoped
#define STRATA_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define STRATA_ZONE_PASS(passName)                                                                                     \
    do {                                                                                                               \
        const char* strataPass_ = (passName);                                                                          \
        ZoneText(strataPass_, std::strlen(strataPass_));                                                               \
    } while (0)
#define STRATA_ZONE_BATCH(begin, end)                                                                                  \
    ZoneScopedN("batch");                                                                                              \
    ZoneValue(static_cast<uint64_t>((end) - (begin)))

#define STRATA_SET_THREAD_NAME(name) tracy::SetThreadName(name)

#define STRATA_PLOT(name, val) TracyPlot(name, val)
#define STRATA_PLOT_COUNT(name) TracyPlotConfig(name, tracy::PlotFormatType::Number, true, false, 0)

#else
#define STRATA_ZONE_SCOPED
#define STRATA_ZONE_SCOPED_N(name)
#define STRATA_ZONE_PASS(passName)
#define STRATA_ZONE_BATCH(begin, end)
#define STRATA_SET_THREAD_NAME(name)
#define STRATA_PLOT(name, val)
#define STRATA_PLOT_COUNT(name)
#endif
