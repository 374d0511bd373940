#pragma once

#include "strata/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// Parsed TOML document with typed, dotted-key accessors ("material.metallic").
// Keys may index arrays: "block[1].id".
// Every accessor reports NotFound for a missing key and TypeMismatch for a
// type mismatch; messages carry the source name and key.
class DataLoader {
  public:
    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    // Wraps an already parsed table, e.g. one element of an array of tables.
    DataLoader(toml::table tbl, std::string source);

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;
    Result<std::vector<double>> getFloatArray(std::string_view key) const;

    // Absent keys yield the default; present keys of the wrong type are still
    // errors.
    Result<std::string> getStringOr(std::string_view key, std::string_view defaultValue) const;
    Result<double> getFloatOr(std::string_view key, double defaultValue) const;
    Result<bool> getBoolOr(std::string_view key, bool defaultValue) const;

    // Elements of an array of tables, each wrapped with "source:key[i]" as its
    // source name. An absent key yields an empty list.
    Result<std::vector<DataLoader>> getTableArray(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const toml::table& table() const;
    const std::string& sourceName() const;

    std::string formatError(std::string_view key, std::string_view expected) const;

  private:
    const toml::node* resolve(std::string_view dottedKey) const;

    // NotFound when the key is absent, TypeMismatch when `fn` yields nullopt.
    template <typename T, typename Extract>
    Result<T> extract(std::string_view key, std::string_view expected, Extract&& fn) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace strata
