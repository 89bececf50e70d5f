#include "dataset_split.h"

#include <cmath>
#include <dlib/svm.h>
#include <iterator>

size_t train_split_size(const size_t num_images, const double train_ratio)
{
    const double cut = std::floor(num_images * train_ratio);
    // also catches NaN
    if (not(cut > 0))
        return 0;
    if (cut >= static_cast<double>(num_images))
        return num_images;
    return static_cast<size_t>(cut);
}

dataset_split split_dataset(
    std::vector<unified_image> images,
    const double train_ratio,
    dlib::rand& rnd)
{
    dlib::randomize_samples(images, rnd);
    const auto num_train = train_split_size(images.size(), train_ratio);
    const auto middle = images.begin() + num_train;

    dataset_split split;
    split.train.assign(std::make_move_iterator(images.begin()), std::make_move_iterator(middle));
    split.val.assign(std::make_move_iterator(middle), std::make_move_iterator(images.end()));
    return split;
}
