// Types.cpp – Lookup helpers for schema tables and decoded containers.

#include "PDZReader/Types.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace pdz {

const char* toString(DecodeError e) noexcept {
    switch (e) {
    case DecodeError::None:                return "none";
    case DecodeError::InsufficientBytes:   return "insufficient bytes";
    case DecodeError::MalformedLength:     return "malformed length";
    case DecodeError::UnrecognizedDialect: return "unrecognized dialect";
    }
    return "?";
}

// ─────────────────────────────────────────────────────────────────────────────
//  DialectDef
// ─────────────────────────────────────────────────────────────────────────────

const RecordDef* DialectDef::find(uint16_t type) const noexcept {
    auto it = records.find(type);
    return it == records.end() ? nullptr : &it->second;
}

std::string DialectDef::recordName(uint16_t type) const {
    if (const RecordDef* def = find(type))
        return def->name;
    return "Unknown Record Type " + std::to_string(type);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Count coercion
// ─────────────────────────────────────────────────────────────────────────────

uint64_t toCount(const Value& v) {
    return std::visit([](const auto& x) -> uint64_t {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, int64_t>) {
            return x < 0 ? 0 : static_cast<uint64_t>(x);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return x;
        } else if constexpr (std::is_floating_point_v<T>) {
            // 2^64 is the first value that no longer fits
            if (!std::isfinite(x) || x <= 0 || x >= 18446744073709551616.0) return 0;
            return static_cast<uint64_t>(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            uint64_t n = 0;
            auto [ptr, ec] = std::from_chars(x.data(), x.data() + x.size(), n);
            if (ec != std::errc{} || ptr != x.data() + x.size()) return 0;
            return n;
        } else {
            return 0;
        }
    }, v);
}

// ─────────────────────────────────────────────────────────────────────────────
//  DecodedFields
// ─────────────────────────────────────────────────────────────────────────────

void DecodedFields::set(std::string name, Value value) {
    for (auto& [key, val] : entries_) {
        if (key == name) {
            val = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

const Value* DecodedFields::find(std::string_view name) const noexcept {
    for (const auto& [key, val] : entries_)
        if (key == name) return &val;
    return nullptr;
}

bool DecodedFields::contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
}

const Value& DecodedFields::at(std::string_view name) const {
    if (const Value* v = find(name))
        return *v;
    throw std::out_of_range("Field '" + std::string(name) + "' not decoded");
}

uint64_t DecodedFields::countOf(std::string_view name) const {
    const Value* v = find(name);
    return v ? toCount(*v) : 0;
}

std::vector<std::string> DecodedFields::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, val] : entries_)
        out.push_back(key);
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  ParsedDocument
// ─────────────────────────────────────────────────────────────────────────────

void ParsedDocument::add(const std::string& name, DecodedFields fields) {
    for (auto& [key, rec] : records_) {
        if (key != name) continue;

        if (auto* single = std::get_if<DecodedFields>(&rec)) {
            std::vector<DecodedFields> phases;
            phases.push_back(std::move(*single));
            phases.push_back(std::move(fields));
            rec = std::move(phases);
        } else {
            std::get<std::vector<DecodedFields>>(rec).push_back(std::move(fields));
        }
        return;
    }
    records_.emplace_back(name, RecordValue{std::move(fields)});
}

bool ParsedDocument::contains(std::string_view name) const noexcept {
    for (const auto& [key, rec] : records_)
        if (key == name) return true;
    return false;
}

const RecordValue& ParsedDocument::at(std::string_view name) const {
    for (const auto& [key, rec] : records_)
        if (key == name) return rec;
    throw std::out_of_range("Record '" + std::string(name) + "' not present");
}

bool ParsedDocument::isMultiPhase(std::string_view name) const {
    return std::holds_alternative<std::vector<DecodedFields>>(at(name));
}

const DecodedFields& ParsedDocument::fields(std::string_view name) const {
    const RecordValue& rec = at(name);
    if (const auto* single = std::get_if<DecodedFields>(&rec))
        return *single;
    throw std::logic_error("Record '" + std::string(name) + "' is multi-phase; use occurrences()");
}

std::span<const DecodedFields> ParsedDocument::occurrences(std::string_view name) const {
    const RecordValue& rec = at(name);
    if (const auto* single = std::get_if<DecodedFields>(&rec))
        return {single, 1};
    return std::get<std::vector<DecodedFields>>(rec);
}

std::vector<std::string> ParsedDocument::names() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& [key, rec] : records_)
        out.push_back(key);
    return out;
}

} // namespace pdz
