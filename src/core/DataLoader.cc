#include "strata/core/DataLoader.hh"

#include <optional>
#include <sstream>
#include <system_error>

#include "strata/core/Log.hh"

namespace strata {

DataLoader::DataLoader(toml::table tbl, std::string source) : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<DataLoader> DataLoader::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<DataLoader>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<DataLoader>::error(ErrorCode::ParseError, "not a readable TOML file: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        STRATA_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), path.string()));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << path.string() << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<DataLoader>::error(ErrorCode::ParseError, oss.str());
    }
}

Result<DataLoader> DataLoader::parse(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto tbl = toml::parse(tomlContent, sourceName);
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), std::string(sourceName)));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << sourceName << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<DataLoader>::error(ErrorCode::ParseError, oss.str());
    }
}

namespace {

// TOML integers are accepted wherever a float is expected.
std::optional<double> asNumber(const toml::node& node) {
    if (auto f = node.as_floating_point()) {
        return f->get();
    }
    if (auto i = node.as_integer()) {
        return static_cast<double>(i->get());
    }
    return std::nullopt;
}

} // namespace

const toml::node* DataLoader::resolve(std::string_view dottedKey) const {
    return table_.at_path(dottedKey).node();
}

std::string DataLoader::formatError(std::string_view key, std::string_view expected) const {
    std::ostringstream oss;
    oss << sourceName_ << ": key '" << key << "' " << expected;
    return oss.str();
}

template <typename T, typename Extract>
Result<T> DataLoader::extract(std::string_view key, std::string_view expected, Extract&& fn) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<T>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    std::optional<T> value = fn(*node);
    if (!value) {
        return Result<T>::error(ErrorCode::TypeMismatch, formatError(key, "is not " + std::string(expected)));
    }
    return Result<T>::ok(std::move(*value));
}

Result<std::string> DataLoader::getString(std::string_view key) const {
    return extract<std::string>(key, "a string", [](const toml::node& n) -> std::optional<std::string> {
        if (auto s = n.as_string()) {
            return s->get();
        }
        return std::nullopt;
    });
}

Result<int64_t> DataLoader::getInt(std::string_view key) const {
    return extract<int64_t>(key, "an integer", [](const toml::node& n) -> std::optional<int64_t> {
        if (auto i = n.as_integer()) {
            return i->get();
        }
        return std::nullopt;
    });
}

Result<double> DataLoader::getFloat(std::string_view key) const {
    return extract<double>(key, "a number", asNumber);
}

Result<bool> DataLoader::getBool(std::string_view key) const {
    return extract<bool>(key, "a boolean", [](const toml::node& n) -> std::optional<bool> {
        if (auto b = n.as_boolean()) {
            return b->get();
        }
        return std::nullopt;
    });
}

Result<std::vector<double>> DataLoader::getFloatArray(std::string_view key) const {
    return extract<std::vector<double>>(key, "an array of numbers",
                                        [](const toml::node& n) -> std::optional<std::vector<double>> {
                                            auto arr = n.as_array();
                                            if (!arr) {
                                                return std::nullopt;
                                            }
                                            std::vector<double> values;
                                            values.reserve(arr->size());
                                            for (const auto& elem : *arr) {
                                                auto v = asNumber(elem);
                                                if (!v) {
                                                    return std::nullopt;
                                                }
                                                values.push_back(*v);
                                            }
                                            return values;
                                        });
}

Result<std::string> DataLoader::getStringOr(std::string_view key, std::string_view defaultValue) const {
    return hasKey(key) ? getString(key) : Result<std::string>::ok(std::string(defaultValue));
}

Result<double> DataLoader::getFloatOr(std::string_view key, double defaultValue) const {
    return hasKey(key) ? getFloat(key) : Result<double>::ok(defaultValue);
}

Result<bool> DataLoader::getBoolOr(std::string_view key, bool defaultValue) const {
    return hasKey(key) ? getBool(key) : Result<bool>::ok(defaultValue);
}

Result<std::vector<DataLoader>> DataLoader::getTableArray(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<std::vector<DataLoader>>::ok({});
    }
    auto arr = node->as_array();
    if (!arr) {
        return Result<std::vector<DataLoader>>::error(ErrorCode::TypeMismatch,
                                                      formatError(key, "is not an array of tables"));
    }

    std::vector<DataLoader> items;
    items.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        auto* tbl = arr->at(i).as_table();
        if (!tbl) {
            return Result<std::vector<DataLoader>>::error(
                ErrorCode::TypeMismatch, formatError(key, "element " + std::to_string(i) + " is not a table"));
        }
        items.emplace_back(*tbl, sourceName_ + ":" + std::string(key) + "[" + std::to_string(i) + "]");
    }
    return Result<std::vector<DataLoader>>::ok(std::move(items));
}

bool DataLoader::hasKey(std::string_view key) const {
    return resolve(key) != nullptr;
}

const toml::table& DataLoader::table() const {
    return table_;
}

const std::string& DataLoader::sourceName() const {
    return sourceName_;
}

} // namespace strata
