#include "lanxfer/engine/filesystem.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

#include "lanxfer/error_codes.hpp"

namespace lanxfer::engine
{

    namespace
    {

        std::string join_relative(const std::string &parent, const std::string &name)
        {
            return parent.empty() ? name : parent + "/" + name;
        }

        std::vector<std::filesystem::path> sorted_children(const std::filesystem::path &directory)
        {
            std::vector<std::filesystem::path> children;
            std::error_code ec;
            for (const auto &entry : std::filesystem::directory_iterator(directory, ec))
            {
                children.push_back(entry.path());
            }
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Cannot list " + directory.string() + ": " + ec.message());
            }
            std::sort(children.begin(), children.end(),
                      [](const std::filesystem::path &lhs, const std::filesystem::path &rhs)
                      { return lhs.filename() < rhs.filename(); });
            return children;
        }

        void append_entry(Manifest &manifest, const std::filesystem::path &source, const std::string &relative)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(source, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Cannot stat " + source.string() + ": " + ec.message());
            }

            const auto name = source.filename().string();
            if (std::filesystem::is_directory(status))
            {
                manifest.files.push_back(protocol::FileEntry{
                    .name = name,
                    .relative_path = relative,
                    .size = 0,
                    .is_directory = true,
                });
                manifest.sources.push_back(source);
                for (const auto &child : sorted_children(source))
                {
                    append_entry(manifest, child, join_relative(relative, child.filename().string()));
                }
                return;
            }

            if (!std::filesystem::is_regular_file(status))
            {
                spdlog::debug("Skipping {}: not a regular file or directory", source.string());
                return;
            }

            const auto size = std::filesystem::file_size(source, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Cannot size " + source.string() + ": " + ec.message());
            }
            manifest.files.push_back(protocol::FileEntry{
                .name = name,
                .relative_path = relative,
                .size = size,
                .is_directory = false,
            });
            manifest.sources.push_back(source);
            manifest.total_size += size;
        }

    } // namespace

    Manifest build_manifest(const std::vector<std::filesystem::path> &paths)
    {
        Manifest manifest;
        for (const auto &input : paths)
        {
            std::error_code ec;
            if (!std::filesystem::exists(input, ec))
            {
                throw TransferError(ErrorCode::NotFound, "Path does not exist: " + input.string());
            }
            auto source = input;
            if (!source.has_filename())
            {
                // "dir/" names the directory itself.
                source = source.parent_path();
            }
            append_entry(manifest, source, source.filename().string());
        }
        return manifest;
    }

    std::filesystem::path resolve_under(const std::filesystem::path &base, const std::string &relative_path)
    {
        const std::filesystem::path relative(relative_path);
        if (relative_path.empty() || relative.has_root_name() || relative.has_root_directory())
        {
            throw TransferError(ErrorCode::PathRejected, "Rejected path: '" + relative_path + "'");
        }

        std::filesystem::path resolved = base;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw TransferError(ErrorCode::PathRejected, "Path traversal rejected: '" + relative_path + "'");
            }
            resolved /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw TransferError(ErrorCode::PathRejected, "Rejected path: '" + relative_path + "'");
        }
        return resolved;
    }

} // namespace lanxfer::engine
