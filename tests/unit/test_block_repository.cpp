/**
 * @file test_block_repository.cpp
 * @brief Unit tests for BlockRepository and the block/manifest JSON codec.
 */

#include "crypto/block_cipher.hpp"
#include "storage/block_codec.hpp"
#include "storage/block_repository.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <numeric>

using namespace model_mesh;

namespace {

Bytes make_model(size_t size) {
    Bytes data(size);
    std::iota(data.begin(), data.end(), uint8_t{7});
    return data;
}

}  // namespace

class BlockRepositoryTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;
    BlockRepository repo_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "mm_test_repository";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(BlockRepositoryTest, ExportSplitsIntoBlocks) {
    auto model = make_model(600);
    auto blocks = repo_.export_model("tiny", model, 256);
    ASSERT_TRUE(blocks.has_value()) << blocks.error().message;

    ASSERT_EQ(blocks->size(), 3u);
    EXPECT_EQ((*blocks)[0].original_size, 256u);
    EXPECT_EQ((*blocks)[2].original_size, 88u);
    EXPECT_EQ(repo_.block_count(), 3u);
    EXPECT_EQ(repo_.key_count(), 1u);
    EXPECT_TRUE(repo_.find_key("tiny_key").has_value());

    auto ordered = repo_.blocks_for_model("tiny");
    ASSERT_EQ(ordered.size(), 3u);
    for (uint32_t i = 0; i < 3; ++i) EXPECT_EQ(ordered[i].block_index, i);
}

TEST_F(BlockRepositoryTest, ExportedBlocksPassIntegrityGate) {
    auto blocks = repo_.export_model("tiny", make_model(300), 128);
    ASSERT_TRUE(blocks.has_value());
    auto key = repo_.find_key("tiny_key");
    ASSERT_TRUE(key.has_value());
    for (const auto& block : *blocks) {
        EXPECT_TRUE(verify_block_integrity(block, *key));
    }
}

TEST_F(BlockRepositoryTest, ExportRejectsEmptyInput) {
    Bytes empty;
    auto result = repo_.export_model("tiny", empty, 128);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
    EXPECT_FALSE(repo_.export_model("tiny", make_model(10), 0).has_value());
}

TEST_F(BlockRepositoryTest, ReexportReusesModelKey) {
    ASSERT_TRUE(repo_.export_model("m", make_model(50), 64).has_value());
    ASSERT_TRUE(repo_.export_model("m", make_model(70), 64).has_value());
    EXPECT_EQ(repo_.key_count(), 1u);
}

TEST_F(BlockRepositoryTest, RevokeKeyRemovesItsBlocks) {
    ASSERT_TRUE(repo_.export_model("a", make_model(200), 64).has_value());
    ASSERT_TRUE(repo_.export_model("b", make_model(100), 64).has_value());

    EXPECT_EQ(repo_.revoke_key("a_key"), 4u);
    EXPECT_FALSE(repo_.find_key("a_key").has_value());
    EXPECT_TRUE(repo_.blocks_for_model("a").empty());
    EXPECT_EQ(repo_.blocks_for_model("b").size(), 2u);
}

TEST_F(BlockRepositoryTest, FindBlocksSkipsUnknownIds) {
    auto blocks = repo_.export_model("m", make_model(100), 64);
    ASSERT_TRUE(blocks.has_value());
    auto found = repo_.find_blocks({(*blocks)[1].block_id, "missing"});
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].block_index, 1u);
}

TEST_F(BlockRepositoryTest, ManifestAndKeyPersistence) {
    ASSERT_TRUE(repo_.export_model("llm", make_model(500), 200).has_value());

    auto manifest_path = repo_.save_manifest("llm", temp_dir_);
    ASSERT_TRUE(manifest_path.has_value()) << manifest_path.error().message;
    auto key_path = repo_.save_key("llm_key", temp_dir_);
    ASSERT_TRUE(key_path.has_value());

    BlockRepository restored;
    auto key_id = restored.load_key(*key_path);
    ASSERT_TRUE(key_id.has_value());
    EXPECT_EQ(*key_id, "llm_key");
    auto loaded = restored.load_manifest(*manifest_path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, 3u);

    auto key = restored.find_key("llm_key");
    ASSERT_TRUE(key.has_value());
    for (const auto& block : restored.blocks_for_model("llm")) {
        EXPECT_TRUE(verify_block_integrity(block, *key));
    }
}

TEST_F(BlockRepositoryTest, SaveManifestOfUnknownModel) {
    auto result = repo_.save_manifest("ghost", temp_dir_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST(BlockCodecTest, BlockJsonKeepsEveryField) {
    auto key = crypto::generate_key("k");
    ASSERT_TRUE(key.has_value());
    auto block = encrypt_block("m", make_model(40), 2, *key);
    ASSERT_TRUE(block.has_value());

    auto json = block_to_json(*block);
    EXPECT_TRUE(json["ciphertext"].isString());
    EXPECT_EQ(json["encrypted_size"].asUInt64(), block->encrypted_size);

    auto decoded = block_from_json(json);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->block_id, block->block_id);
    EXPECT_EQ(decoded->ciphertext, block->ciphertext);
    EXPECT_EQ(decoded->nonce, block->nonce);
    EXPECT_EQ(decoded->tag, block->tag);
    EXPECT_EQ(decoded->checksum, block->checksum);
    EXPECT_TRUE(verify_block_integrity(*decoded, *key));
}

TEST(BlockCodecTest, RejectsMissingFields) {
    Json::Value incomplete(Json::objectValue);
    incomplete["block_id"] = "b";
    auto decoded = block_from_json(incomplete);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::InvalidInput);
}
