#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include "sequence_decoder.h"

// 每行一个时间步，argmax 处置 1
static cv::Mat one_hot(const std::vector<int> &argmax, int classes) {
    cv::Mat logits = cv::Mat::zeros(static_cast<int>(argmax.size()), classes, CV_32F);
    for (int t = 0; t < static_cast<int>(argmax.size()); ++t)
        logits.at<float>(t, argmax[t]) = 1.f;
    return logits;
}

TEST(SequenceDecoder, CollapsesRepeats) {
    SequenceDecoder decoder({"A", "B"});
    DecodedSpan span = decoder.decode(one_hot({1, 1, 0, 2}, 3));
    EXPECT_EQ(span.text, "AB");
    EXPECT_FLOAT_EQ(span.confidence, 1.f);
}

TEST(SequenceDecoder, BlankSeparatesRepeatedSymbol) {
    SequenceDecoder decoder({"A", "B"});
    EXPECT_EQ(decoder.decode(one_hot({1, 0, 1}, 3)).text, "AA");
}

TEST(SequenceDecoder, AllBlankIsEmptyWithZeroConfidence) {
    SequenceDecoder decoder({"A", "B"});
    DecodedSpan span = decoder.decode(one_hot({0, 0, 0}, 3));
    EXPECT_TRUE(span.text.empty());
    EXPECT_FLOAT_EQ(span.confidence, 0.f);
}

TEST(SequenceDecoder, OutOfRangeClassIsSkipped) {
    SequenceDecoder decoder({"A", "B"});
    DecodedSpan span = decoder.decode(one_hot({4, 1}, 5));
    EXPECT_EQ(span.text, "A");
}

TEST(SequenceDecoder, MultiByteSymbols) {
    SequenceDecoder decoder({"대", "표", "자"});
    EXPECT_EQ(decoder.decode(one_hot({1, 0, 2, 2, 3}, 4)).text, "대표자");
}

TEST(SequenceDecoder, DecodeFromRawTensor) {
    SequenceDecoder decoder({"A", "B"});
    cv::Mat logits = one_hot({2, 0, 1}, 3);
    DecodedSpan span = decoder.decode(logits.ptr<float>(), {1, 3, 3});
    EXPECT_EQ(span.text, "BA");
    EXPECT_EQ(decoder.decode(logits.ptr<float>(), {3, 3}).text, "BA");
}

TEST(SequenceDecoder, MalformedShapeThrows) {
    SequenceDecoder decoder({"A"});
    float data[4] = {0, 1, 0, 1};
    EXPECT_THROW(decoder.decode(data, {4}), std::invalid_argument);
    EXPECT_THROW(decoder.decode(data, {2, 1, 2}), std::invalid_argument);
    EXPECT_THROW(decoder.decode(nullptr, {1, 2, 2}), std::invalid_argument);
    EXPECT_THROW(decoder.decode(cv::Mat::zeros(2, 2, CV_8U)), std::invalid_argument);
}

TEST(SequenceDecoder, LoadsDictionaryAndAppendsSpace) {
    const std::string path = ::testing::TempDir() + "bizreg_dict.txt";
    {
        std::ofstream ofs(path);
        ofs << "가\n나 \r\n다\n";
    }
    SequenceDecoder decoder = SequenceDecoder::from_file(path);
    ASSERT_EQ(decoder.symbols().size(), 4u);
    EXPECT_EQ(decoder.symbols()[1], "나");
    EXPECT_EQ(decoder.symbols()[3], " ");
    EXPECT_EQ(decoder.decode(one_hot({1, 4, 2}, 5)).text, "가 나");
}

TEST(SequenceDecoder, MissingDictionaryThrows) {
    EXPECT_THROW(SequenceDecoder::from_file("/nonexistent/bizreg_dict.txt"), std::runtime_error);
}
