#include "remcp/resume.hpp"

#include <system_error>

#include "remcp/error_codes.hpp"

namespace remcp::resume
{

    std::filesystem::path partial_path_for(const std::filesystem::path &target)
    {
        auto partial = target;
        partial += kPartialSuffix;
        return partial;
    }

    ResumePoint locate(const std::filesystem::path &target)
    {
        ResumePoint point{.offset = 0, .partial_path = partial_path_for(target)};
        std::error_code ec;
        if (std::filesystem::is_regular_file(point.partial_path, ec))
        {
            const auto size = std::filesystem::file_size(point.partial_path, ec);
            if (!ec)
            {
                point.offset = size;
            }
        }
        return point;
    }

    void finalize(const std::filesystem::path &partial_path, const std::filesystem::path &target)
    {
        std::error_code ec;
        std::filesystem::rename(partial_path, target, ec);
        if (ec)
        {
            throw TransferError(ErrorKind::FileError,
                                "Failed to finalize " + target.string() + ": " + ec.message());
        }
    }

    void discard(const std::filesystem::path &partial_path)
    {
        std::error_code ec;
        std::filesystem::remove(partial_path, ec);
        if (ec)
        {
            throw TransferError(ErrorKind::FileError,
                                "Failed to remove " + partial_path.string() + ": " + ec.message());
        }
    }

} // namespace remcp::resume
