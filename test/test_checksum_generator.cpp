#include "../checksum/checksum_generator.hpp"
#include "../common/hash_utils.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<BlockFingerprint> drain(ChecksumStream& stream) {
    std::vector<BlockFingerprint> out;
    while (auto f = stream.next()) out.push_back(std::move(*f));
    return out;
}

std::string md5Of(const std::string& data) {
    EvpHasher hasher("md5");
    hasher.update(data.data(), data.size());
    return hasher.digest();
}

// hasher whose update() fails from the given call on
class ThrowingHasher : public StrongHasher {
public:
    explicit ThrowingHasher(int failAt) : failAt_(failAt) {}
    void reset() override {}
    void update(const char*, size_t) override {
        if (calls_++ >= failAt_) throw std::runtime_error("hardware digest engine lost");
    }
    std::string digest() override { return "x"; }
    size_t size() const override { return 1; }
    std::string name() const override { return "throwing"; }
private:
    int failAt_;
    int calls_ = 0;
};

}

class ChecksumGeneratorTest : public ::testing::Test {
protected:
    SyncOptions optionsWithBlockSize(size_t blockSize) {
        SyncOptions options;
        options.blockSize = blockSize;
        return options;
    }
};

TEST_F(ChecksumGeneratorTest, EmitsOneFingerprintPerBlock) {
    const size_t blockSizes[] = {1, 3, 4, 7, 64};
    const std::string contents[] = {"", "a", "abcd", "abcdefghij", std::string(1000, 'z')};

    for (size_t blockSize : blockSizes) {
        for (const std::string& content : contents) {
            std::istringstream in(content);
            StreamReader reader(in);
            auto started = generateChecksums(&reader, CancellationToken(), optionsWithBlockSize(blockSize));
            ASSERT_TRUE(started.success);

            auto records = drain(*started.data);
            size_t expected = (content.size() + blockSize - 1) / blockSize;
            ASSERT_EQ(records.size(), expected) << "L=" << content.size() << " B=" << blockSize;
            for (size_t i = 0; i < records.size(); ++i) {
                EXPECT_EQ(records[i].index, i);
                EXPECT_FALSE(records[i].error.has_value());
            }
        }
    }
}

TEST_F(ChecksumGeneratorTest, ChecksumsCoverExactBytesOfEachBlock) {
    std::istringstream in("ABCDEFGHIJ");
    StreamReader reader(in);
    auto started = generateChecksums(&reader, CancellationToken(), optionsWithBlockSize(4));
    ASSERT_TRUE(started.success);

    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 3u);

    const std::string blocks[] = {"ABCD", "EFGH", "IJ"};
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(records[i].weakHash, HashUtils::computeWeakHash(blocks[i].data(), blocks[i].size()));
        EXPECT_EQ(records[i].strongHash, md5Of(blocks[i]));
    }
}

TEST_F(ChecksumGeneratorTest, ShortReadsAreFilledUpToTheBlockSize) {
    ScriptedReader reader({ScriptedReader::chunk("AB"), ScriptedReader::chunk("CD"), ScriptedReader::chunk("E")});
    auto started = generateChecksums(&reader, CancellationToken(), optionsWithBlockSize(4));
    ASSERT_TRUE(started.success);

    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].strongHash, md5Of("ABCD"));
    EXPECT_EQ(records[1].strongHash, md5Of("E"));
}

TEST_F(ChecksumGeneratorTest, NullSource_FailsWithClosedStream) {
    auto started = generateChecksums(nullptr, CancellationToken());
    EXPECT_FALSE(started.success);
    EXPECT_EQ(started.code, ErrorCode::InvalidInput);
    EXPECT_EQ(started.message, "reader required");
    ASSERT_NE(started.data, nullptr);
    EXPECT_FALSE(started.data->next().has_value());
}

TEST_F(ChecksumGeneratorTest, ZeroBlockSize_IsInvalidInput) {
    std::istringstream in("abc");
    StreamReader reader(in);
    auto started = generateChecksums(&reader, CancellationToken(), optionsWithBlockSize(0));
    EXPECT_FALSE(started.success);
    EXPECT_EQ(started.code, ErrorCode::InvalidInput);
    EXPECT_FALSE(started.data->next().has_value());
}

TEST_F(ChecksumGeneratorTest, UnknownHashAlgorithm_IsInvalidInput) {
    std::istringstream in("abc");
    StreamReader reader(in);
    SyncOptions options;
    options.hashAlgorithm = "no-such-digest";
    auto started = generateChecksums(&reader, CancellationToken(), options);
    EXPECT_FALSE(started.success);
    EXPECT_EQ(started.code, ErrorCode::InvalidInput);
}

TEST_F(ChecksumGeneratorTest, CancelledBeforeStart_EmitsSingleCancellationRecord) {
    std::istringstream in("abcdefgh");
    StreamReader reader(in);
    CancellationToken token;
    token.cancel();

    auto started = generateChecksums(&reader, token, optionsWithBlockSize(4));
    ASSERT_TRUE(started.success);

    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].index, 0u);
    ASSERT_TRUE(records[0].error.has_value());
    EXPECT_EQ(records[0].error->code, ErrorCode::Cancelled);
}

TEST_F(ChecksumGeneratorTest, CancelledMidStream_EndsWithOneRecordAtNextIndex) {
    std::vector<ScriptedReader::Step> steps(10, ScriptedReader::chunk("abcd"));
    ScriptedReader reader(steps);
    CancellationToken token;
    // cancellation lands while block 3 is being read
    reader.onRead([token](size_t index) mutable {
        if (index == 3) token.cancel("shutting down");
    });

    auto started = generateChecksums(&reader, token, optionsWithBlockSize(4));
    ASSERT_TRUE(started.success);

    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 5u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(records[i].index, i);
        EXPECT_FALSE(records[i].error.has_value());
    }
    EXPECT_EQ(records[4].index, 4u);
    ASSERT_TRUE(records[4].error.has_value());
    EXPECT_EQ(records[4].error->code, ErrorCode::Cancelled);
    EXPECT_EQ(records[4].error->message, "shutting down");
    EXPECT_EQ(reader.reads(), 4u);
}

TEST_F(ChecksumGeneratorTest, PassedDeadline_ReportsDeadlineExceeded) {
    std::istringstream in("abcdefgh");
    StreamReader reader(in);
    auto token = CancellationToken::withDeadline(CancellationToken::Clock::now() - std::chrono::seconds(1));

    auto started = generateChecksums(&reader, token, optionsWithBlockSize(4));
    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error->code, ErrorCode::DeadlineExceeded);
}

TEST_F(ChecksumGeneratorTest, ReadError_IsReportedInlineAndGenerationContinues) {
    ScriptedReader reader({ScriptedReader::chunk("AAAA"),
                           ScriptedReader::failure("device not ready"),
                           ScriptedReader::chunk("CCCC")});
    auto started = generateChecksums(&reader, CancellationToken(), optionsWithBlockSize(4));
    ASSERT_TRUE(started.success);

    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 3u);

    EXPECT_FALSE(records[0].error.has_value());

    EXPECT_EQ(records[1].index, 1u);
    ASSERT_TRUE(records[1].error.has_value());
    EXPECT_EQ(records[1].error->code, ErrorCode::Io);
    EXPECT_EQ(records[1].error->message, "failed reading block: device not ready");

    EXPECT_EQ(records[2].index, 2u);
    EXPECT_FALSE(records[2].error.has_value());
    EXPECT_EQ(records[2].strongHash, md5Of("CCCC"));
}

TEST_F(ChecksumGeneratorTest, LegacyMode_AppendsEmptyDigestToBlockBytes) {
    std::istringstream in("abcdef");
    StreamReader reader(in);
    SyncOptions options = optionsWithBlockSize(4);
    options.strongHashMode = StrongHashMode::LegacyAppend;

    auto started = generateChecksums(&reader, CancellationToken(), options);
    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].strongHash, "abcd" + md5Of(""));
    EXPECT_EQ(records[1].strongHash, "ef" + md5Of(""));
    EXPECT_EQ(records[0].weakHash, HashUtils::computeWeakHash("abcd", 4));
}

TEST_F(ChecksumGeneratorTest, HasherFactory_OverridesAlgorithmName) {
    std::istringstream in("abc");
    StreamReader reader(in);
    SyncOptions options;
    options.hashAlgorithm = "no-such-digest";
    options.hasherFactory = []() { return std::make_unique<EvpHasher>("sha1"); };

    auto started = generateChecksums(&reader, CancellationToken(), options);
    ASSERT_TRUE(started.success);
    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(HashUtils::toHex(records[0].strongHash), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(ChecksumGeneratorTest, HasherFailure_EndsStreamWithInternalError) {
    std::istringstream in("aaaabbbbcccc");
    StreamReader reader(in);
    SyncOptions options = optionsWithBlockSize(4);
    options.hasherFactory = []() { return std::make_unique<ThrowingHasher>(1); };

    auto started = generateChecksums(&reader, CancellationToken(), options);
    ASSERT_TRUE(started.success);
    auto records = drain(*started.data);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_FALSE(records[0].error.has_value());
    EXPECT_EQ(records[1].index, 1u);
    ASSERT_TRUE(records[1].error.has_value());
    EXPECT_EQ(records[1].error->code, ErrorCode::Internal);
}

TEST_F(ChecksumGeneratorTest, ConsumerClose_StopsReadingTheSource) {
    std::vector<ScriptedReader::Step> steps(1000, ScriptedReader::chunk("x"));
    ScriptedReader reader(steps);
    {
        auto started = generateChecksums(&reader, CancellationToken(), optionsWithBlockSize(1));
        ASSERT_TRUE(started.success);
        ASSERT_TRUE(started.data->next().has_value());
        started.data->close();
        EXPECT_FALSE(started.data->next().has_value());
    }
    // at most the block that was waiting to be handed over was read
    EXPECT_LE(reader.reads(), 2u);
}
