#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Unwraps an optional or returns std::nullopt from the enclosing function.
#if __clang__ || __GNUC__
#define TRY(failable)                     \
    ({                                    \
        auto result = (failable);         \
        if (!result) return std::nullopt; \
        *result;                          \
    })
#else
#error "Unsupported compiler: TRY macro only supported for GCC and Clang"
#endif

namespace Util
{

template<typename... Handlers>
struct [[nodiscard]] Overloaded : Handlers...
{
    using Handlers::operator()...;
};

[[nodiscard]] auto trim(std::string_view str) -> std::string_view;
[[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

// "avg_waiting_time" -> "Avg Waiting Time"
[[nodiscard]] auto snake_case_to_title(std::string_view str) -> std::string;

[[nodiscard]] auto parse_natural(std::string_view str) -> std::optional<std::size_t>;
[[nodiscard]] auto parse_real(std::string_view str) -> std::optional<double>;

[[nodiscard]] auto read_entire_file(const std::filesystem::path& file_path) -> std::optional<std::string>;
[[nodiscard]] auto write_to_file(const std::filesystem::path& file_path, const std::string& content) -> bool;

// Uniform in [min, max]; returns `min` when the range is empty.
[[nodiscard]] auto random_natural(std::size_t min, std::size_t max) -> std::size_t;

} // namespace Util
