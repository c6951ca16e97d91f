#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

struct AppOptions
{
    int32_t width{ 10 };
    int32_t height{ 10 };
    std::optional<int32_t> seed{};
    std::optional<Cell> start{};
    std::optional<Cell> end{};
    bool showExplored{ false };
    bool trace{ false };
    bool help{ false };

    Cell StartOrDefault() const { return start.value_or(Cell{ 0, 0 }); }
    Cell EndOrDefault() const { return end.value_or(Cell{ width - 1, height - 1 }); }

    // Throws std::invalid_argument if start/end fall outside width x height.
    void Validate() const;
};

// Parses argv[1..]. Throws std::invalid_argument on unknown flags or bad values.
AppOptions ParseOptions(int argc, const char* const* argv, const AppOptions& defaults = AppOptions{});

std::string Usage(const std::string& program, const AppOptions& defaults = AppOptions{});

int32_t ParseInt32(const std::string& text, const std::string& what);
Cell ParseCell(const std::string& text, const std::string& what);
