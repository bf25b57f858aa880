/**
 * @file test_inventory_store.cpp
 * @brief Backup grouping, completeness and ordering
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/inventory/inventory_store.h>

#include "../../test_fixtures.h"

namespace kcenon::cloud_backup::test {

using namespace std::chrono_literals;

class InventoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<memory_object_store>();
        now_ = std::chrono::system_clock::now();
    }

    auto totals(uint32_t data, uint32_t parity) -> std::map<std::string, std::string> {
        return {{meta::chunk_total, std::to_string(data)},
                {meta::parity_total, std::to_string(parity)}};
    }

    auto add_backup(const std::string& host, uint64_t number, uint32_t data, uint32_t parity,
                    std::chrono::system_clock::time_point when) -> void {
        for (uint32_t seq = 1; seq <= data + parity; ++seq) {
            auto kind = seq > data ? chunk_kind::parity : chunk_kind::data;
            store_->add_object(make_object_key(host, number, seq, kind), 100, when,
                               totals(data, parity));
        }
    }

    std::shared_ptr<memory_object_store> store_;
    std::chrono::system_clock::time_point now_;
};

TEST_F(InventoryStoreTest, GroupsPartsPerBackup) {
    add_backup("gandalf", 12, 3, 1, now_ - 2h);
    add_backup("gandalf", 13, 2, 0, now_ - 1h);
    add_backup("frodo", 1, 1, 0, now_ - 3h);

    inventory_store inventory(store_);
    auto records = inventory.list();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 3u);

    // Newest first
    EXPECT_EQ(records.value()[0].backup_number, 13u);
    EXPECT_EQ(records.value()[1].backup_number, 12u);
    EXPECT_EQ(records.value()[2].host, "frodo");

    const auto& b12 = records.value()[1];
    EXPECT_EQ(b12.parts.size(), 4u);
    EXPECT_EQ(b12.data_count(), 3u);
    EXPECT_EQ(b12.parity_count(), 1u);
    EXPECT_EQ(b12.total_bytes, 400u);
    EXPECT_EQ(b12.expected_chunks, 3u);
    EXPECT_EQ(b12.expected_parity, 1u);
    EXPECT_TRUE(b12.is_complete());
    EXPECT_EQ(b12.parts.back().key.kind, chunk_kind::parity);
}

TEST_F(InventoryStoreTest, OldestFirstOrdering) {
    add_backup("gandalf", 12, 1, 0, now_ - 2h);
    add_backup("gandalf", 13, 1, 0, now_ - 1h);

    inventory_query query;
    query.order = inventory_order::oldest_first;
    auto records = inventory_store(store_).list(query);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 2u);
    EXPECT_EQ(records.value()[0].backup_number, 12u);
}

TEST_F(InventoryStoreTest, HostFilterIncludesLegacyKeys) {
    add_backup("gandalf", 12, 1, 0, now_ - 1h);
    add_backup("gandalfino", 1, 1, 0, now_ - 1h);
    store_->add_object("gandalf.5.tar.gz.aa.gpg", 50, now_ - 48h);
    store_->add_object("gandalf.5.tar.gz.ab.gpg", 50, now_ - 48h);
    store_->add_object("frodo.2.tar.gpg", 10, now_ - 48h);

    inventory_query query;
    query.host = "gandalf";
    auto records = inventory_store(store_).list(query);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 2u);

    const auto& legacy = records.value()[1];
    EXPECT_EQ(legacy.backup_number, 5u);
    EXPECT_TRUE(legacy.legacy);
    EXPECT_EQ(legacy.data_count(), 2u);
    EXPECT_FALSE(legacy.expected_chunks.has_value());
    EXPECT_TRUE(legacy.is_complete());
}

TEST_F(InventoryStoreTest, ForeignKeysAreIgnored) {
    add_backup("gandalf", 12, 1, 0, now_);
    store_->add_object("README.txt", 10, now_);
    store_->add_object("gandalf/12/notes", 10, now_);

    auto records = inventory_store(store_).list();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].parts.size(), 1u);
}

TEST_F(InventoryStoreTest, MissingDataPartIsIncomplete) {
    add_backup("gandalf", 12, 3, 1, now_);
    ASSERT_TRUE(store_->delete_object("gandalf/12/000002").has_value());

    auto record = inventory_store(store_).find("gandalf", 12);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record.value().is_complete());
    EXPECT_EQ(record.value().missing_sequences(), std::vector<uint32_t>{2});
}

TEST_F(InventoryStoreTest, MissingTrailingPartDetectedFromMetadata) {
    add_backup("gandalf", 12, 3, 0, now_);
    ASSERT_TRUE(store_->delete_object("gandalf/12/000003").has_value());

    auto record = inventory_store(store_).find("gandalf", 12);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record.value().is_complete());
    EXPECT_EQ(record.value().missing_sequences(), std::vector<uint32_t>{3});
}

TEST_F(InventoryStoreTest, MissingParityIsIncomplete) {
    add_backup("gandalf", 12, 2, 2, now_);
    ASSERT_TRUE(store_->delete_object("gandalf/12/000004.par2").has_value());

    auto record = inventory_store(store_).find("gandalf", 12);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record.value().missing_sequences().empty());
    EXPECT_FALSE(record.value().is_complete());
}

TEST_F(InventoryStoreTest, FindUnknownBackup) {
    add_backup("gandalf", 12, 1, 0, now_);
    auto record = inventory_store(store_).find("gandalf", 99);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, error_code::backup_not_found);
}

TEST_F(InventoryStoreTest, LatestPicksHighestBackupNumber) {
    add_backup("gandalf", 12, 1, 0, now_);
    add_backup("gandalf", 14, 1, 0, now_ - 5h);
    add_backup("gandalf", 13, 1, 0, now_ - 1h);

    auto record = inventory_store(store_).latest("gandalf");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().backup_number, 14u);
    EXPECT_EQ(record.value().expected_chunks, 1u);

    auto none = inventory_store(store_).latest("frodo");
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, error_code::backup_not_found);
}

TEST_F(InventoryStoreTest, AgeUsesNewestUpload) {
    store_->add_object("gandalf/12/000001", 1, now_ - 10h);
    store_->add_object("gandalf/12/000002", 1, now_ - 4h);

    auto records = inventory_store(store_).list();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].age(now_), std::chrono::seconds(4h));
}

TEST_F(InventoryStoreTest, SkippingTotalsAvoidsHeadRequests) {
    add_backup("gandalf", 12, 2, 0, now_);

    inventory_query query;
    query.load_totals = false;
    auto records = inventory_store(store_).list(query);
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(store_->head_calls(), 0);
    EXPECT_FALSE(records.value()[0].expected_chunks.has_value());
}

TEST_F(InventoryStoreTest, ListErrorPropagates) {
    store_->list_fault = error{error_code::access_denied, "HTTP 403"};
    auto records = inventory_store(store_).list();
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, error_code::access_denied);
}

}  // namespace kcenon::cloud_backup::test
