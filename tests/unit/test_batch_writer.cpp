#include <gtest/gtest.h>
#include "storage/batch_writer.hpp"
#include "storage/error_sink.hpp"
#include "test_support.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace wdi;
using json = nlohmann::json;
using wdi::testing_support::MemoryRecordStore;

class BatchWriterTest : public ::testing::Test {
protected:
    MemoryRecordStore store;

    static json doc(int i) {
        return {{"id_entity", i}, {"entity", "Q" + std::to_string(i)}};
    }
};

// ==========================================
// Flush Threshold
// ==========================================

TEST_F(BatchWriterTest, FullBatchFlushesExactlyOnce) {
    AsyncFlusher flusher(store);
    BatchWriter writer(flusher, 100);

    for (int i = 0; i < 100; ++i) {
        writer.append(RecordKind::Items, doc(i));
    }
    flusher.wait_all();

    EXPECT_EQ(writer.flushes(), 1u);
    EXPECT_EQ(writer.buffered(RecordKind::Items), 0u);
    EXPECT_EQ(store.batch_count(RecordKind::Items), 1u);
    EXPECT_EQ(store.documents(RecordKind::Items).size(), 100u);
}

TEST_F(BatchWriterTest, PartialBatchWaitsForStreamEnd) {
    AsyncFlusher flusher(store);
    BatchWriter writer(flusher, 100);

    for (int i = 0; i < 99; ++i) {
        writer.append(RecordKind::Items, doc(i));
    }
    flusher.wait_all();

    EXPECT_EQ(writer.flushes(), 0u);
    EXPECT_EQ(writer.buffered(RecordKind::Items), 99u);
    EXPECT_EQ(store.batch_count(RecordKind::Items), 0u);

    writer.flush_all();
    flusher.wait_all();

    EXPECT_EQ(writer.flushes(), 1u);
    EXPECT_EQ(store.documents(RecordKind::Items).size(), 99u);
}

TEST_F(BatchWriterTest, KindsFlushIndependently) {
    AsyncFlusher flusher(store);
    BatchWriter writer(flusher, 3);

    for (int i = 0; i < 3; ++i) writer.append(RecordKind::Objects, doc(i));
    writer.append(RecordKind::Literals, doc(9));
    flusher.wait_all();

    EXPECT_EQ(store.batch_count(RecordKind::Objects), 1u);
    EXPECT_EQ(store.batch_count(RecordKind::Literals), 0u);
    EXPECT_EQ(writer.buffered(RecordKind::Literals), 1u);
}

TEST_F(BatchWriterTest, FlushAllSkipsEmptyBuffers) {
    AsyncFlusher flusher(store);
    BatchWriter writer(flusher, 10);

    writer.append(RecordKind::Types, doc(1));
    writer.flush_all();
    flusher.wait_all();

    EXPECT_EQ(writer.flushes(), 1u);
    EXPECT_EQ(store.batch_count(RecordKind::Types), 1u);
    EXPECT_EQ(store.batch_count(RecordKind::Items), 0u);
}

TEST_F(BatchWriterTest, EntityRecordsFillAllFourKinds) {
    AsyncFlusher flusher(store);
    BatchWriter writer(flusher, 100);

    EntityRecords records;
    records.item.entity = records.objects.entity = records.literals.entity = records.types.entity = "Q1";
    writer.append(records);

    for (RecordKind kind : entity_record_kinds()) {
        EXPECT_EQ(writer.buffered(kind), 1u) << to_string(kind);
    }
}

TEST_F(BatchWriterTest, ConcurrentAppendsLoseNothing) {
    AsyncFlusher flusher(store);
    BatchWriter writer(flusher, 7);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&writer, t]() {
            for (int i = 0; i < 250; ++i) {
                writer.append(RecordKind::Items, doc(t * 1000 + i));
            }
        });
    }
    for (auto& th : threads) th.join();
    writer.flush_all();
    flusher.wait_all();

    auto docs = store.documents(RecordKind::Items);
    EXPECT_EQ(docs.size(), 2000u);

    std::set<int> ids;
    for (const auto& d : docs) ids.insert(d["id_entity"].get<int>());
    EXPECT_EQ(ids.size(), 2000u);
}

// ==========================================
// Flusher
// ==========================================

TEST_F(BatchWriterTest, FailedInsertIsCountedAndRunContinues) {
    store.fail_inserts = true;
    AsyncFlusher flusher(store);

    FlushBatch batch;
    batch.kind = RecordKind::Items;
    batch.documents = {doc(1)};
    ASSERT_TRUE(flusher.enqueue(batch));
    flusher.wait_all();

    EXPECT_EQ(flusher.batches_failed(), 1u);
    EXPECT_FALSE(flusher.fatal());

    store.fail_inserts = false;
    ASSERT_TRUE(flusher.enqueue(batch));
    flusher.wait_all();
    EXPECT_EQ(flusher.batches_flushed(), 1u);
    EXPECT_EQ(flusher.records_written(RecordKind::Items), 1u);
}

TEST_F(BatchWriterTest, UnavailableStoreTurnsFatal) {
    store.fail_inserts = true;
    store.available = false;
    AsyncFlusher flusher(store);

    FlushBatch batch;
    batch.kind = RecordKind::Objects;
    batch.documents = {doc(1)};
    flusher.enqueue(batch);
    flusher.wait_all();

    EXPECT_TRUE(flusher.fatal());
    EXPECT_NE(flusher.fatal_message().find("memory"), std::string::npos);

    store.fail_inserts = false;
    flusher.enqueue(batch);
    flusher.wait_all();
    EXPECT_EQ(flusher.batches_failed(), 2u);
    EXPECT_EQ(store.batch_count(RecordKind::Objects), 0u);
}

TEST_F(BatchWriterTest, StoppedFlusherRejectsBatches) {
    AsyncFlusher flusher(store);
    flusher.stop();

    FlushBatch batch;
    batch.documents = {doc(1)};
    EXPECT_FALSE(flusher.enqueue(batch));
}

TEST_F(BatchWriterTest, TryEnqueueKeepsRejectedBatch) {
    AsyncFlusher flusher(store);

    FlushBatch batch;
    batch.kind = RecordKind::Types;
    batch.documents = {doc(1)};
    ASSERT_TRUE(flusher.try_enqueue(batch));
    EXPECT_TRUE(batch.documents.empty());
    flusher.wait_all();
    EXPECT_EQ(store.documents(RecordKind::Types).size(), 1u);

    flusher.stop();
    batch.documents = {doc(2), doc(3)};
    EXPECT_FALSE(flusher.try_enqueue(batch));
    EXPECT_EQ(batch.documents.size(), 2u);
}

// ==========================================
// Error Sink
// ==========================================

TEST_F(BatchWriterTest, ErrorsReachTheLogCollection) {
    AsyncFlusher flusher(store);
    StoreErrorSink sink(flusher);

    sink.record("Q42", "type_error", "stage=classify exception=json::exception line=3");
    sink.record("", "not an entity", "stage=classify exception=EntityFormatError line=0");
    sink.close();
    flusher.wait_all();

    auto docs = store.documents(RecordKind::Errors);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(sink.recorded(), 2u);
    EXPECT_EQ(sink.pending(), 0u);
    EXPECT_EQ(docs[0]["entity"], "Q42");
    EXPECT_TRUE(docs[1]["entity"].is_null());
    EXPECT_EQ(docs[1]["error"], "not an entity");
}

TEST_F(BatchWriterTest, ErrorSinkNeverThrowsOnDeadStore) {
    store.fail_inserts = true;
    store.available = false;
    AsyncFlusher flusher(store);
    StoreErrorSink sink(flusher);

    EXPECT_NO_THROW(sink.record("Q1", "boom", "ctx"));
    flusher.wait_all();
    EXPECT_NO_THROW(sink.record("Q2", "boom", "ctx"));
    EXPECT_NO_THROW(sink.close());
    EXPECT_EQ(sink.recorded(), 2u);
}

TEST_F(BatchWriterTest, ErrorSinkBacklogIsBounded) {
    AsyncFlusher flusher(store);
    flusher.stop();
    StoreErrorSink sink(flusher, 3);

    for (int i = 0; i < 5; ++i) {
        sink.record("Q" + std::to_string(i), "boom", "ctx");
    }

    EXPECT_EQ(sink.recorded(), 5u);
    EXPECT_EQ(sink.pending(), 3u);
    EXPECT_EQ(sink.dropped(), 2u);

    sink.close();
    EXPECT_EQ(sink.pending(), 0u);
    EXPECT_TRUE(store.documents(RecordKind::Errors).empty());
}

TEST_F(BatchWriterTest, ErrorSinkDrainsBacklogOnceFlusherHasRoom) {
    AsyncFlusher flusher(store);
    StoreErrorSink sink(flusher, 2);

    for (int i = 0; i < 10; ++i) {
        sink.record("Q" + std::to_string(i), "boom", "ctx");
        flusher.wait_all();
    }
    sink.close();
    flusher.wait_all();

    EXPECT_EQ(sink.dropped(), 0u);
    EXPECT_EQ(store.documents(RecordKind::Errors).size(), 10u);
}
