#include <gtest/gtest.h>

#include "errors.h"
#include "layout_writer.h"
#include "temp_directory.h"

#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace
{
    const std::string two_images = R"({
        "images": [
            {"id": 1, "file_name": "img1.jpg", "width": 100, "height": 100},
            {"id": 2, "file_name": "img2.jpg", "width": 200, "height": 200}
        ],
        "annotations": [
            {"id": 1, "image_id": 1, "category_id": 3, "bbox": [10, 10, 20, 20], "area": 400}
        ]
    })";

    std::set<std::string> list_files(const fs::path& dir)
    {
        std::set<std::string> names;
        if (not fs::exists(dir))
            return names;
        for (const auto& entry : fs::directory_iterator(dir))
            names.insert(entry.path().filename().string());
        return names;
    }

    class LayoutWriterTest : public ::testing::Test
    {
        protected:
        conversion_summary run(
            const std::vector<fs::path>& files,
            const conversion_options& options,
            const std::string& output = "out",
            const std::string& seed = "42")
        {
            dlib::rand rnd;
            rnd.set_seed(seed);
            const auto image_root = dir.path() / "input";
            return convert_dataset(files, image_root, dir.path() / output, options, rnd, messages);
        }

        conversion_options standard_options(const bool structure) const
        {
            conversion_options options;
            options.format = annotation_format::standard;
            options.train_split = 1.0;
            options.yolo_structure = structure;
            return options;
        }

        temp_directory dir;
        std::ostringstream messages;
    };

    TEST_F(LayoutWriterTest, FlatLayoutTwoImageExample)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        const auto summary = run({input}, standard_options(false));

        EXPECT_EQ(dir.read("out/img1.txt"), "3 0.200000 0.200000 0.200000 0.200000\n");
        EXPECT_TRUE(fs::exists(dir.path() / "out/img2.txt"));
        EXPECT_EQ(dir.read("out/img2.txt"), "");
        EXPECT_EQ(dir.read("out/classes.txt"), "class_3\n");

        EXPECT_EQ(summary.num_files, 1u);
        EXPECT_EQ(summary.num_images, 2u);
        EXPECT_EQ(summary.num_annotations, 1u);
        EXPECT_EQ(summary.num_labels, 2u);
        EXPECT_EQ(summary.num_missing, 0u);
        EXPECT_NE(messages.str().find("Conversion completed!"), std::string::npos);
    }

    TEST_F(LayoutWriterTest, FlatLayoutWithoutClasses)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        auto options = standard_options(false);
        options.create_classes = false;
        run({input}, options);
        EXPECT_TRUE(fs::exists(dir.path() / "out/img1.txt"));
        EXPECT_FALSE(fs::exists(dir.path() / "out/classes.txt"));
    }

    TEST_F(LayoutWriterTest, NoClassesFileWithoutAnnotations)
    {
        const auto input = dir.write("input/dataset.json", R"({
            "images": [{"id": 1, "file_name": "img1.jpg", "width": 10, "height": 10}],
            "annotations": []
        })");
        const auto summary = run({input}, standard_options(false));
        EXPECT_EQ(summary.num_classes, 0u);
        EXPECT_EQ(dir.read("out/img1.txt"), "");
        EXPECT_FALSE(fs::exists(dir.path() / "out/classes.txt"));
    }

    TEST_F(LayoutWriterTest, MergesClassesAcrossFiles)
    {
        const auto first = dir.write("input/a.json", R"({"annotations": [{
            "file_name": "sub/a.jpg", "height": 10, "width": 20, "image_id": 1,
            "annotations": [{"bbox": [[0, 0], [10, 5]], "category_id": 12},
                            {"bbox": [[2, 2], [4, 4]], "category_id": 1}]
        }]})");
        const auto second = dir.write("input/b.json", R"({"annotations": [{
            "file_name": "b.png", "height": 10, "width": 10, "image_id": 1,
            "annotations": [{"bbox": [[0, 0], [10, 10]], "category_id": 12}]
        }]})");
        conversion_options options;
        options.format = annotation_format::damm;
        const auto summary = run({first, second}, options);

        EXPECT_EQ(summary.num_files, 2u);
        EXPECT_EQ(summary.num_images, 2u);
        EXPECT_EQ(summary.num_annotations, 3u);
        EXPECT_EQ(dir.read("out/a.txt"),
                  "12 0.250000 0.250000 0.500000 0.500000\n"
                  "1 0.150000 0.300000 0.100000 0.200000\n");
        EXPECT_EQ(dir.read("out/b.txt"), "12 0.500000 0.500000 1.000000 1.000000\n");
        EXPECT_EQ(dir.read("out/classes.txt"), "class_1\nclass_12\n");
    }

    TEST_F(LayoutWriterTest, StructuredLayoutCopiesImagesAndLabels)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        dir.write("input/img1.jpg", "first image bytes");
        dir.write("input/photos/img2.jpg", std::string("\x89PNG\0\r\n", 7));
        const auto summary = run({input}, standard_options(true));

        EXPECT_EQ(summary.num_train, 2u);
        EXPECT_EQ(summary.num_val, 0u);
        EXPECT_EQ(summary.num_missing, 0u);
        EXPECT_EQ(list_files(dir.path() / "out/train/images"),
                  (std::set<std::string>{"img1.jpg", "img2.jpg"}));
        EXPECT_EQ(list_files(dir.path() / "out/train/labels"),
                  (std::set<std::string>{"img1.txt", "img2.txt"}));
        EXPECT_TRUE(fs::is_directory(dir.path() / "out/val/images"));
        EXPECT_TRUE(fs::is_directory(dir.path() / "out/val/labels"));
        EXPECT_TRUE(list_files(dir.path() / "out/val/images").empty());

        EXPECT_EQ(dir.read("out/train/images/img1.jpg"), "first image bytes");
        EXPECT_EQ(dir.read("out/train/images/img2.jpg"), std::string("\x89PNG\0\r\n", 7));
        EXPECT_EQ(dir.read("out/train/labels/img1.txt"), "3 0.200000 0.200000 0.200000 0.200000\n");
        EXPECT_EQ(dir.read("out/train/labels/img2.txt"), "");
        EXPECT_EQ(dir.read("out/classes.txt"), "class_3\n");
    }

    TEST_F(LayoutWriterTest, StructuredLayoutSkipsMissingImages)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        dir.write("input/img2.jpg", "second");
        const auto summary = run({input}, standard_options(true));

        EXPECT_EQ(summary.num_missing, 1u);
        EXPECT_EQ(summary.num_labels, 1u);
        EXPECT_EQ(list_files(dir.path() / "out/train/images"), (std::set<std::string>{"img2.jpg"}));
        EXPECT_EQ(list_files(dir.path() / "out/train/labels"), (std::set<std::string>{"img2.txt"}));
        // the only annotation belonged to the missing image
        EXPECT_FALSE(fs::exists(dir.path() / "out/classes.txt"));
        EXPECT_NE(messages.str().find("Missing image: img1.jpg"), std::string::npos);
    }

    TEST_F(LayoutWriterTest, StructuredLayoutKeepsResolvedExtension)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        dir.write("input/img1.png", "png");
        dir.write("input/img2.bmp", "bmp");
        const auto summary = run({input}, standard_options(true));

        EXPECT_EQ(summary.num_missing, 0u);
        EXPECT_EQ(list_files(dir.path() / "out/train/images"),
                  (std::set<std::string>{"img1.png", "img2.bmp"}));
        EXPECT_EQ(list_files(dir.path() / "out/train/labels"),
                  (std::set<std::string>{"img1.txt", "img2.txt"}));
    }

    TEST_F(LayoutWriterTest, StructuredLayoutSplitsByRatio)
    {
        std::ostringstream sout;
        sout << R"({"annotations": [)";
        for (int i = 0; i < 10; ++i)
        {
            if (i > 0)
                sout << ',';
            sout << R"({"file_name": "im)" << i << R"(.jpg", "height": 10, "width": 10, )"
                 << R"("image_id": )" << i << R"(, "annotations": [{"bbox": [[0, 0], [5, 5]], )"
                 << R"("category_id": )" << i % 3 << "}]}";
            dir.write("input/im" + std::to_string(i) + ".jpg", "image");
        }
        sout << "]}";
        const auto input = dir.write("input/damm.json", sout.str());
        conversion_options options;
        options.train_split = 0.7;
        options.yolo_structure = true;
        const auto summary = run({input}, options);

        EXPECT_EQ(summary.num_train, 7u);
        EXPECT_EQ(summary.num_val, 3u);
        const auto train = list_files(dir.path() / "out/train/labels");
        const auto val = list_files(dir.path() / "out/val/labels");
        EXPECT_EQ(train.size(), 7u);
        EXPECT_EQ(val.size(), 3u);
        for (const auto& name : val)
            EXPECT_EQ(train.count(name), 0u);
        EXPECT_EQ(list_files(dir.path() / "out/train/images").size(), 7u);
        EXPECT_EQ(list_files(dir.path() / "out/val/images").size(), 3u);
        EXPECT_EQ(dir.read("out/classes.txt"), "class_0\nclass_1\nclass_2\n");
    }

    TEST_F(LayoutWriterTest, SameSeedGivesIdenticalOutput)
    {
        std::ostringstream sout;
        sout << R"({"annotations": [)";
        for (int i = 0; i < 8; ++i)
        {
            if (i > 0)
                sout << ',';
            sout << R"({"file_name": "p)" << i << R"(.jpg", "height": 64, "width": 48, )"
                 << R"("image_id": )" << i << R"(, "annotations": [{"bbox": [[1, 2], [)"
                 << 3 + i << ", " << 7 + i
                 << R"(]], "category_id": )" << i << "}]}";
            dir.write("input/p" + std::to_string(i) + ".jpg", "p");
        }
        sout << "]}";
        const auto input = dir.write("input/damm.json", sout.str());
        conversion_options options;
        options.train_split = 0.5;
        options.yolo_structure = true;
        run({input}, options, "first", "7");
        run({input}, options, "second", "7");

        for (const auto set : {"train", "val"})
        {
            const auto labels = fs::path(set) / "labels";
            const auto names = list_files(dir.path() / "first" / labels);
            EXPECT_EQ(names, list_files(dir.path() / "second" / labels));
            for (const auto& name : names)
                EXPECT_EQ(dir.read("first/" + (labels / name).string()),
                          dir.read("second/" + (labels / name).string()));
        }
    }

    TEST_F(LayoutWriterTest, RerunWithOutputInsideTheImageRoot)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        dir.write("input/pics/img1.jpg", "first image bytes");
        dir.write("input/pics/img2.jpg", "second image bytes");
        auto options = standard_options(true);
        options.train_split = 0.5;

        // "input/out/..." sorts before "input/pics/...", the copies must not become sources
        const auto first = run({input}, options, "input/out", "3");
        const auto labels = dir.read("input/out/train/labels/img1.txt") +
                            dir.read("input/out/val/labels/img1.txt");
        const auto second = run({input}, options, "input/out", "3");

        EXPECT_EQ(first.num_missing, 0u);
        EXPECT_EQ(second.num_missing, 0u);
        EXPECT_EQ(second.num_labels, 2u);
        EXPECT_EQ(dir.read("input/out/train/labels/img1.txt") +
                      dir.read("input/out/val/labels/img1.txt"),
                  labels);
        EXPECT_EQ(list_files(dir.path() / "input/out/train/images").size(), 1u);
        EXPECT_EQ(list_files(dir.path() / "input/out/val/images").size(), 1u);
        for (const auto set : {"train", "val"})
        {
            for (const auto& name : list_files(dir.path() / "input/out" / set / "images"))
            {
                const auto copy = dir.read("input/out/" + std::string(set) + "/images/" + name);
                EXPECT_EQ(copy, dir.read("input/pics/" + name));
            }
        }
    }

    TEST_F(LayoutWriterTest, ImagesMissingFromTheSourcesAreNotTakenFromOldOutput)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        dir.write("input/out/train/images/img1.jpg", "left over from an earlier run");
        dir.write("input/img2.jpg", "second");
        const auto summary = run({input}, standard_options(true), "input/out");

        EXPECT_EQ(summary.num_missing, 1u);
        EXPECT_NE(messages.str().find("Missing image: img1.jpg"), std::string::npos);
    }

    TEST_F(LayoutWriterTest, MalformedFileAbortsTheRun)
    {
        const auto good = dir.write("input/a.json", two_images);
        const auto bad = dir.write("input/b.json", R"({"images": [], "annotations": [{"id": 1}]})");
        EXPECT_THROW(run({good, bad}, standard_options(false)), parse_error);
        EXPECT_FALSE(fs::exists(dir.path() / "out/img1.txt"));
    }

    TEST_F(LayoutWriterTest, WrongFormatIsAParseError)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        conversion_options options;
        options.format = annotation_format::damm;
        EXPECT_THROW(run({input}, options), parse_error);
    }

    TEST_F(LayoutWriterTest, StructuredLayoutNeedsAnImageRoot)
    {
        const auto input = dir.write("elsewhere/dataset.json", two_images);
        EXPECT_THROW(run({input}, standard_options(true)), config_error);
        EXPECT_FALSE(fs::exists(dir.path() / "out"));
    }

    TEST_F(LayoutWriterTest, NoInputFiles)
    {
        EXPECT_THROW(run({}, standard_options(false)), config_error);
    }

    TEST_F(LayoutWriterTest, UnwritableOutputIsAnIoError)
    {
        const auto input = dir.write("input/dataset.json", two_images);
        dir.write("blocked", "a file where the output directory should be");
        EXPECT_THROW(run({input}, standard_options(false), "blocked"), io_error);
    }
}  // namespace
