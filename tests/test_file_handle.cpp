#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <vector>

#include "../frameio/include/frameio/file_handle.hpp"
#include "test_helpers.hpp"

using namespace frameio;
using namespace frameio_test;

namespace {

FileLayout single_file_layout(const TempDataset& dataset) {
    return dataset.fileset()[0];
}

} // namespace

// ============================================================================
// Views
// ============================================================================

TEST(FileHandleTest, DecodedViewSkipsFrameHeader) {
    DatasetSpec spec;
    spec.frame_header = 8;
    spec.sig_shape = {4};
    spec.frames_per_file = {10};
    TempDataset dataset("fh_header", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());

    auto decoded = handle.decoded_view();
    ASSERT_TRUE(decoded.is_ok());
    const FrameView& view = decoded.value();
    EXPECT_EQ(view.num_frames, 10u);
    EXPECT_EQ(view.frame_elements, 4u);
    EXPECT_EQ(view.frame_stride, 24u);

    auto raw = handle.raw_view();
    ASSERT_TRUE(raw.is_ok());
    ASSERT_EQ(raw.value().size(), 240u);

    // Elements [2:6) of each 24-byte record, i.e. a header skip of 2 elements
    for (std::size_t f = 0; f < 10; ++f) {
        for (std::size_t e = 0; e < 4; ++e) {
            uint32_t from_raw;
            std::memcpy(&from_raw, raw.value().data() + f * 24 + (2 + e) * 4, 4);
            EXPECT_EQ(view.at<uint32_t>(f, e), from_raw);
            EXPECT_EQ(view.at<uint32_t>(f, e), static_cast<uint32_t>(expected_value(f, e)));
        }
    }
}

TEST(FileHandleTest, RawViewStripsOnlyFileHeader) {
    DatasetSpec spec;
    spec.file_header = 16;
    spec.frame_header = 4;
    spec.frame_footer = 4;
    spec.frames_per_file = {3};
    TempDataset dataset("fh_raw", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());

    auto raw = handle.raw_view();
    ASSERT_TRUE(raw.is_ok());
    const std::size_t stride = 4 + 16 + 4;
    EXPECT_EQ(raw.value().size(), 3 * stride);
    // Frame header bytes are still present in the raw view
    EXPECT_EQ(raw.value()[0], std::byte{0xEE});

    auto decoded = handle.decoded_view();
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().at<uint32_t>(2, 3), static_cast<uint32_t>(expected_value(2, 3)));
    EXPECT_FALSE(decoded.value().is_contiguous());
}

// ============================================================================
// Open failures
// ============================================================================

TEST(FileHandleTest, MisalignedFrameHeaderFailsBeforeMapping) {
    DatasetSpec spec;
    spec.frame_header = 6;
    spec.frames_per_file = {4};
    TempDataset dataset("fh_misaligned", spec);

    FileHandle handle(single_file_layout(dataset));
    auto result = handle.open();
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::MisalignedLayout);
    EXPECT_FALSE(handle.is_open());
    EXPECT_FALSE(handle.decoded_view().is_ok());
    EXPECT_FALSE(handle.raw_view().is_ok());
}

TEST(FileHandleTest, MisalignedFrameFooterFails) {
    FileLayout layout;
    layout.path = "/nonexistent/never_opened.raw";
    layout.native_type = element_type_of<uint16_t>();
    layout.frame_footer = 3;
    layout.sig_shape = {8};
    layout.num_frames = 1;

    FileHandle handle(layout);
    auto result = handle.open();
    ASSERT_FALSE(result.is_ok());
    // The alignment check runs before the file is even opened
    EXPECT_EQ(result.error().code, Error::Code::MisalignedLayout);
}

TEST(FileHandleTest, MissingFileReportsFileNotFound) {
    FileLayout layout;
    layout.path = "/nonexistent/frameio_missing.raw";
    layout.native_type = element_type_of<uint32_t>();
    layout.sig_shape = {4};
    layout.num_frames = 1;

    FileHandle handle(layout);
    auto result = handle.open();
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::FileNotFound);
}

TEST(FileHandleTest, SizeMismatchReportsInvalidLayout) {
    DatasetSpec spec;
    spec.frames_per_file = {4};
    TempDataset dataset("fh_size", spec);

    FileLayout layout = single_file_layout(dataset);
    layout.num_frames = 5;
    FileHandle handle(layout);
    auto result = handle.open();
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::InvalidLayout);
    EXPECT_FALSE(handle.is_open());
}

// ============================================================================
// Close
// ============================================================================

TEST(FileHandleTest, EveryAccessorFailsAfterClose) {
    DatasetSpec spec;
    spec.frames_per_file = {2};
    TempDataset dataset("fh_close", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());
    ASSERT_TRUE(is_mapped(handle.layout().path));
    handle.close();

    EXPECT_FALSE(handle.is_open());
    EXPECT_FALSE(is_mapped(handle.layout().path));

    auto raw = handle.raw_view();
    ASSERT_FALSE(raw.is_ok());
    EXPECT_EQ(raw.error().code, Error::Code::FileClosed);

    auto decoded = handle.decoded_view();
    ASSERT_FALSE(decoded.is_ok());
    EXPECT_EQ(decoded.error().code, Error::Code::FileClosed);

    EXPECT_EQ(handle.seek(0).error().code, Error::Code::FileClosed);
    EXPECT_EQ(handle.tell().error().code, Error::Code::FileClosed);
    EXPECT_EQ(handle.fileno().error().code, Error::Code::FileClosed);
    std::array<std::byte, 4> buffer{};
    EXPECT_EQ(handle.read_into(buffer).error().code, Error::Code::FileClosed);
}

TEST(FileHandleTest, MovedFromHandleIsClosed) {
    DatasetSpec spec;
    spec.frames_per_file = {2};
    TempDataset dataset("fh_move", spec);

    FileHandle first(single_file_layout(dataset));
    ASSERT_TRUE(first.open().is_ok());
    FileHandle second(std::move(first));

    EXPECT_TRUE(second.is_open());
    EXPECT_FALSE(first.is_open());
    EXPECT_TRUE(second.decoded_view().is_ok());
}

// ============================================================================
// Buffered access
// ============================================================================

TEST(FileHandleTest, SeekTellReadInto) {
    DatasetSpec spec;
    spec.file_header = 8;
    spec.sig_shape = {4};
    spec.frames_per_file = {3};
    TempDataset dataset("fh_buffered", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());

    // Frame 1, element 2
    const uint64_t pos = 8 + 1 * 16 + 2 * 4;
    ASSERT_TRUE(handle.seek(pos).is_ok());
    auto tell = handle.tell();
    ASSERT_TRUE(tell.is_ok());
    EXPECT_EQ(tell.value(), pos);

    std::array<uint32_t, 2> values{};
    auto bytes = std::as_writable_bytes(std::span(values));
    ASSERT_TRUE(handle.read_into(bytes).is_ok());
    EXPECT_EQ(values[0], static_cast<uint32_t>(expected_value(1, 2)));
    EXPECT_EQ(values[1], static_cast<uint32_t>(expected_value(1, 3)));
    EXPECT_EQ(handle.tell().value(), pos + 8);

    auto fd = handle.fileno();
    ASSERT_TRUE(fd.is_ok());
    EXPECT_GE(fd.value(), 0);
}

TEST(FileHandleTest, ReadIntoPastEndOfFile) {
    DatasetSpec spec;
    spec.sig_shape = {4};
    spec.frames_per_file = {1};
    TempDataset dataset("fh_eof", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());
    ASSERT_TRUE(handle.seek(12).is_ok());

    std::array<std::byte, 8> buffer{};
    auto result = handle.read_into(buffer);
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::UnexpectedEndOfFile);
}

TEST(FileHandleTest, ReadaheadHintOnOpenFile) {
    DatasetSpec spec;
    spec.frames_per_file = {4};
    TempDataset dataset("fh_advise", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());
    EXPECT_TRUE(handle.advise_willneed(16, 32).is_ok());
    handle.close();
    EXPECT_EQ(handle.advise_willneed(0, 16).error().code, Error::Code::FileClosed);
}

TEST(FileHandleTest, ReadaheadHintPastEndOfFile) {
    DatasetSpec spec;
    spec.frames_per_file = {4};
    TempDataset dataset("fh_advise_end", spec);

    FileHandle handle(single_file_layout(dataset));
    ASSERT_TRUE(handle.open().is_ok());
    const std::size_t file_size = single_file_layout(dataset).expected_file_size();

    // Clipped to the end of the file
    EXPECT_TRUE(handle.advise_willneed(file_size - 4, 4096).is_ok());

    auto at_end = handle.advise_willneed(file_size, 16);
    ASSERT_FALSE(at_end.is_ok());
    EXPECT_EQ(at_end.error().code, Error::Code::OutOfBounds);

    auto beyond = handle.advise_willneed(file_size + 4096, 16);
    ASSERT_FALSE(beyond.is_ok());
    EXPECT_EQ(beyond.error().code, Error::Code::OutOfBounds);
}
