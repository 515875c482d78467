/// @file error.cpp
/// @brief Error formatting and statistics for skirmish_core

#include <skirmish/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>

namespace skirmish_core {

// =============================================================================
// Error Chain
// =============================================================================

namespace {

void describe(std::ostream& out, const std::string& message) {
    out << message;
}

void describe(std::ostream& out, const CombatError& err) {
    out << "[CombatError] " << err.message;
    if (!err.combatant_id.empty()) out << " (combatant: " << err.combatant_id << ")";
    if (!err.action_id.empty()) out << " (action: " << err.action_id << ")";
}

void describe(std::ostream& out, const ConfigError& err) {
    out << "[ConfigError] " << err.message;
    if (!err.source.empty()) out << " (source: " << err.source << ")";
    if (!err.field.empty()) out << " (field: " << err.field << ")";
}

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    out << "[" << error_code_name(error.code()) << "] ";
    std::visit([&out](const auto& err) { describe(out, err); }, error.variant());

    if (!error.context().empty()) {
        out << "\n  with";
        for (const auto& [key, value] : error.context()) {
            out << " " << key << "=" << value;
        }
    }
    return out.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_code_count = static_cast<std::size_t>(ErrorCode::Stalled) + 1;

std::array<std::atomic<std::uint64_t>, k_code_count> s_counts{};

std::size_t slot(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    return index < k_code_count ? index : 0;
}

} // anonymous namespace

void record_error(const Error& error) {
    s_counts[slot(error.code())].fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t total_error_count() {
    std::uint64_t total = 0;
    for (const auto& count : s_counts) {
        total += count.load(std::memory_order_relaxed);
    }
    return total;
}

std::uint64_t error_count(ErrorCode code) {
    return s_counts[slot(code)].load(std::memory_order_relaxed);
}

void reset_error_stats() {
    for (auto& count : s_counts) {
        count.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    std::ostringstream out;
    out << "Errors: " << total_error_count() << "\n";
    for (std::size_t i = 0; i < k_code_count; ++i) {
        auto count = s_counts[i].load(std::memory_order_relaxed);
        if (count > 0) {
            out << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": " << count << "\n";
        }
    }
    return out.str();
}

} // namespace debug

} // namespace skirmish_core
