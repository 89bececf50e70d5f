#ifndef image_resolver_h_INCLUDED
#define image_resolver_h_INCLUDED

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Extensions tried, in this order, when the declared image name is not found as is.
const std::array<const char*, 6> candidate_extensions{"jpg", "jpeg", "png", "bmp", "tiff", "tif"};

// Finds the image files that annotation files refer to.  The image root is scanned
// recursively once, at construction; when several files share a name the first one in path
// order is used.  Files under any of the excluded directories are left out of the index, so
// the copies made by an earlier run into an output tree inside the root are never picked up.
class image_resolver
{
    public:
    image_resolver() = delete;
    explicit image_resolver(
        const std::filesystem::path& image_root,
        const std::vector<std::filesystem::path>& excluded = {});

    // Looks up the base name of declared_name, then the same name with each of the candidate
    // extensions.  Returns std::nullopt when nothing matches.
    std::optional<std::filesystem::path> resolve(const std::string& declared_name) const;

    size_t size() const { return files.size(); }

    private:
    std::optional<std::filesystem::path> find(const std::string& name) const;
    std::unordered_map<std::string, std::filesystem::path> files;
};

#endif  // image_resolver_h_INCLUDED
