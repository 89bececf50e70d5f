#ifndef dataset_h_INCLUDED
#define dataset_h_INCLUDED

#include <dlib/geometry.h>

#include <string>
#include <vector>

// A box in absolute pixel coordinates: (left, top) is the first corner and (right, bottom)
// the second one.  The values are kept exactly as they were read, so inverted or degenerate
// boxes are possible.
struct unified_annotation
{
    unified_annotation() = default;
    unified_annotation(const dlib::drectangle& rect, const unsigned long category_id)
        : rect(rect), category_id(category_id)
    {
    }
    dlib::drectangle rect;
    unsigned long category_id = 0;
};

struct unified_image
{
    // name as declared in the annotation file, possibly with a directory prefix
    std::string file_name;
    unsigned long width = 0;
    unsigned long height = 0;
    std::vector<unified_annotation> annotations;
};

#endif  // dataset_h_INCLUDED
