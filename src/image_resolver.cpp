#include "image_resolver.h"

#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <dlib/dir_nav.h>
#include <limits>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    bool is_inside(const fs::path& file, const fs::path& dir)
    {
        const auto rel = file.lexically_relative(dir);
        return not rel.empty() and *rel.begin() != "..";
    }
}  // namespace

image_resolver::image_resolver(const fs::path& image_root, const std::vector<fs::path>& excluded)
{
    if (not fs::is_directory(image_root))
        throw config_error("Image directory does not exist: " + image_root.string());

    // the excluded directories may not exist yet
    std::vector<fs::path> skip;
    for (const auto& dir : excluded)
        skip.push_back(fs::weakly_canonical(fs::absolute(dir)));

    auto found = dlib::get_files_in_directory_tree(
        dlib::directory(image_root.string()),
        dlib::match_all(),
        std::numeric_limits<unsigned long>::max());
    std::sort(
        found.begin(),
        found.end(),
        [](const auto& a, const auto& b) { return a.full_name() < b.full_name(); });
    for (const auto& file : found)
    {
        const auto path = fs::weakly_canonical(file.full_name());
        const auto in_skipped = std::any_of(
            skip.begin(),
            skip.end(),
            [&](const fs::path& dir) { return is_inside(path, dir); });
        if (not in_skipped)
            files.emplace(file.name(), file.full_name());
    }
}

std::optional<fs::path> image_resolver::find(const std::string& name) const
{
    const auto it = files.find(name);
    if (it == files.end())
        return std::nullopt;
    return it->second;
}

std::optional<fs::path> image_resolver::resolve(const std::string& declared_name) const
{
    const auto name = base_name(declared_name);
    if (auto path = find(name))
        return path;

    const auto stem = base_name_without_extension(name);
    for (const auto ext : candidate_extensions)
    {
        if (auto path = find(stem + "." + ext))
            return path;
    }
    return std::nullopt;
}
