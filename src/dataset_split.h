#ifndef dataset_split_h_INCLUDED
#define dataset_split_h_INCLUDED

#include "dataset.h"

#include <dlib/rand.h>

struct dataset_split
{
    std::vector<unified_image> train;
    std::vector<unified_image> val;
};

// Number of training images for a dataset of num_images: floor(num_images * train_ratio),
// clamped to [0, num_images].  Ratios outside [0, 1] are accepted and simply saturate.
size_t train_split_size(const size_t num_images, const double train_ratio);

// Shuffles the images with rnd and puts the first train_split_size() of them in the training
// set, the rest in the validation set.  The same seed always gives the same split.
dataset_split split_dataset(
    std::vector<unified_image> images,
    const double train_ratio,
    dlib::rand& rnd);

#endif  // dataset_split_h_INCLUDED
