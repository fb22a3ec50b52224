/**
 * remcp - Partial-file markers that make interrupted transfers resumable.
 *
 * A transfer towards `target` accumulates its bytes in `target.part`. The
 * marker's length is the resume offset; it is renamed over the target once the
 * expected total has arrived and left untouched otherwise.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace remcp::resume
{

    constexpr std::string_view kPartialSuffix = ".part";

    struct ResumePoint
    {
        std::uint64_t offset{};
        std::filesystem::path partial_path;
    };

    std::filesystem::path partial_path_for(const std::filesystem::path &target);

    ResumePoint locate(const std::filesystem::path &target);

    // Throws remcp::TransferError (FileError) when the rename fails.
    void finalize(const std::filesystem::path &partial_path, const std::filesystem::path &target);

    void discard(const std::filesystem::path &partial_path);

} // namespace remcp::resume
