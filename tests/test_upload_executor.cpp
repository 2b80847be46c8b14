#include <catch2/catch.hpp>

#include <atomic>
#include <optional>

#include "blocks/block_sequencer.hpp"
#include "common/upload_error.hpp"
#include "test_support.hpp"
#include "uploader/upload_executor.hpp"

using namespace azupload;
using azupload_test::FakeBlockStore;
using azupload_test::SimulatedCrash;
using azupload_test::TempDir;

namespace
{
    ExecutorOptions optionsWithBlockSize(uint64_t blockSize)
    {
        ExecutorOptions options;
        options.blockSize = blockSize;
        options.retryPolicy = RetryPolicy(0, std::chrono::milliseconds(0));
        return options;
    }

    std::vector<std::string> idsFor(uint64_t count)
    {
        std::vector<std::string> ids;
        for (uint64_t i = 0; i < count; ++i)
        {
            ids.push_back(BlockSequencer::blockIdFor(i));
        }
        return ids;
    }

    std::optional<ErrorKind> runFailureKind(UploadExecutor &executor, const std::filesystem::path &source)
    {
        try
        {
            executor.run(source);
        }
        catch (const UploadError &e)
        {
            return e.kind();
        }
        FAIL("expected the run to throw");
        return std::nullopt;
    }
}

TEST_CASE("Uninterrupted upload commits every block and removes the restart record")
{
    TempDir dir;
    auto source = dir / "big.bin";
    auto bytes = azupload_test::patternBytes(1000);
    azupload_test::writeFile(source, bytes);

    FakeBlockStore remote;
    RestartStore store;
    UploadExecutor executor(remote, store, optionsWithBlockSize(64));

    UploadResult result = executor.run(source);
    REQUIRE(result.status == UploadStatus::Completed);
    CHECK(remote.committedIds() == idsFor(16));
    CHECK(remote.committedContent() == bytes);
    CHECK(remote.putBlockCalls.size() == 16);
    CHECK(remote.putBlockListCalls.size() == 1);
    CHECK_FALSE(store.exists(source));
}

TEST_CASE("Checksum sent with each block matches the bytes on disk")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));

    FakeBlockStore remote;
    RestartStore store;
    UploadExecutor executor(remote, store, optionsWithBlockSize(100));
    REQUIRE(executor.run(source).completed());

    REQUIRE(remote.putBlockCalls.size() == 3);
    BlockSequencer sequencer(250, 100);
    for (const auto &call : remote.putBlockCalls)
    {
        auto block = sequencer.next();
        REQUIRE(block.has_value());
        CHECK(call.blockId == block->blockId);
        CHECK(call.size == block->length);
        auto onDisk = azupload_test::readRange(source, block->offset, block->length);
        CHECK(call.contentMd5 == checksum::md5Base64(onDisk.data(), onDisk.size()));
    }
}

TEST_CASE("Crash after block k leaves a record with k ids and resuming completes the same list")
{
    const uint64_t fileSize = 1000;
    const uint64_t blockSize = 64;
    const uint64_t blockCount = 16;
    const long k = GENERATE(0L, 1L, 7L, 15L);

    TempDir dir;
    auto source = dir / "big.bin";
    auto bytes = azupload_test::patternBytes(fileSize);
    azupload_test::writeFile(source, bytes);

    FakeBlockStore remote;
    RestartStore store;
    remote.crashOnPutBlockCall = k;

    {
        UploadExecutor executor(remote, store, optionsWithBlockSize(blockSize));
        CHECK_THROWS_AS(executor.run(source), SimulatedCrash);
    }

    auto record = store.load(source);
    REQUIRE(record.has_value());
    CHECK(record->committedBlockIds.size() == static_cast<size_t>(k));
    CHECK(record->remainingBytes == static_cast<int64_t>(fileSize - k * blockSize));
    CHECK(record->currentBlockNumber == static_cast<uint64_t>(k));
    CHECK(record->currentBlockId == BlockSequencer::blockIdFor(k));

    size_t callsBeforeResume = remote.putBlockCalls.size();
    UploadExecutor resumed(remote, store, optionsWithBlockSize(blockSize));
    UploadResult result = resumed.run(source);
    REQUIRE(result.status == UploadStatus::Completed);

    CHECK(remote.committedIds() == idsFor(blockCount));
    CHECK(remote.committedContent() == bytes);
    CHECK(remote.putBlockCalls.size() - callsBeforeResume == blockCount - k);
    CHECK(remote.putBlockCalls[callsBeforeResume].blockId == BlockSequencer::blockIdFor(k));
    CHECK_FALSE(store.exists(source));
}

TEST_CASE("250/100 scenario interrupted after block 1 resumes to [block0, block1, block2]")
{
    TempDir dir;
    auto source = dir / "scenario.bin";
    auto bytes = azupload_test::patternBytes(250);
    azupload_test::writeFile(source, bytes);

    FakeBlockStore remote;
    RestartStore store;
    remote.crashOnPutBlockCall = 2;
    {
        UploadExecutor executor(remote, store, optionsWithBlockSize(100));
        CHECK_THROWS_AS(executor.run(source), SimulatedCrash);
    }
    REQUIRE(store.exists(source));

    UploadExecutor resumed(remote, store, optionsWithBlockSize(100));
    REQUIRE(resumed.run(source).completed());

    REQUIRE(remote.putBlockListCalls.size() == 1);
    CHECK(remote.putBlockListCalls[0] == idsFor(3));
    CHECK(remote.committedIds() == idsFor(3));
    CHECK(remote.committedContent() == bytes);
    CHECK(remote.sentIds() == idsFor(3));
}

TEST_CASE("Transfer failure keeps the record and the retry skips confirmed blocks")
{
    TempDir dir;
    auto source = dir / "big.bin";
    auto bytes = azupload_test::patternBytes(250);
    azupload_test::writeFile(source, bytes);

    FakeBlockStore remote;
    RestartStore store;
    remote.failPutBlockCalls = {1};

    UploadExecutor executor(remote, store, optionsWithBlockSize(100));
    UploadResult failed = executor.run(source);
    REQUIRE(failed.status == UploadStatus::TransferFailed);
    CHECK(failed.resumable());
    CHECK(remote.putBlockListCalls.empty());

    auto record = store.load(source);
    REQUIRE(record.has_value());
    CHECK(record->committedBlockIds == idsFor(1));
    CHECK(record->currentBlockNumber == 1);
    CHECK(record->remainingBytes == 150);
    CHECK(record->currentBlockId == BlockSequencer::blockIdFor(1));
    CHECK(*record == failed.state);

    size_t callsBeforeResume = remote.putBlockCalls.size();
    UploadResult result = executor.run(source);
    REQUIRE(result.status == UploadStatus::Completed);
    std::vector<std::string> sent = remote.sentIds();
    std::vector<std::string> resent(sent.begin() + static_cast<std::ptrdiff_t>(callsBeforeResume), sent.end());
    CHECK(resent == std::vector<std::string>{BlockSequencer::blockIdFor(1), BlockSequencer::blockIdFor(2)});
    CHECK(remote.committedIds() == idsFor(3));
    CHECK(remote.committedContent() == bytes);
    CHECK_FALSE(store.exists(source));
}

TEST_CASE("Transient block failures are retried within one run when configured")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));

    FakeBlockStore remote;
    RestartStore store;
    remote.failPutBlockCalls = {1, 2};

    std::vector<std::chrono::milliseconds> slept;
    ExecutorOptions options = optionsWithBlockSize(100);
    options.retryPolicy = RetryPolicy(2, std::chrono::milliseconds(5), [&](std::chrono::milliseconds d)
                                      { slept.push_back(d); });
    UploadExecutor executor(remote, store, options);

    REQUIRE(executor.run(source).completed());
    CHECK(remote.sentIds() == std::vector<std::string>{BlockSequencer::blockIdFor(0), BlockSequencer::blockIdFor(1),
                                                       BlockSequencer::blockIdFor(1), BlockSequencer::blockIdFor(1),
                                                       BlockSequencer::blockIdFor(2)});
    CHECK(slept == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(5), std::chrono::milliseconds(10)});
}

TEST_CASE("Failed commit keeps the record and the next run only commits")
{
    TempDir dir;
    auto source = dir / "big.bin";
    auto bytes = azupload_test::patternBytes(250);
    azupload_test::writeFile(source, bytes);

    FakeBlockStore remote;
    RestartStore store;
    remote.failPutBlockListTimes = 1;

    UploadExecutor executor(remote, store, optionsWithBlockSize(100));
    REQUIRE(executor.run(source).status == UploadStatus::CommitFailed);

    auto record = store.load(source);
    REQUIRE(record.has_value());
    CHECK(record->remainingBytes == 0);
    CHECK(record->committedBlockIds == idsFor(3));
    CHECK_FALSE(record->inFlight());

    size_t callsBeforeResume = remote.putBlockCalls.size();
    REQUIRE(executor.run(source).completed());
    CHECK(remote.putBlockCalls.size() == callsBeforeResume);
    CHECK(remote.committedContent() == bytes);
    CHECK_FALSE(store.exists(source));
}

TEST_CASE("Verification mismatch keeps the record")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));

    FakeBlockStore remote;
    RestartStore store;
    remote.dropLastBlockOnCommit = true;

    UploadExecutor executor(remote, store, optionsWithBlockSize(100));
    UploadResult result = executor.run(source);
    CHECK(result.status == UploadStatus::VerificationFailed);
    CHECK_FALSE(result.resumable());
    CHECK(store.exists(source));
}

TEST_CASE("Zero-byte source commits an empty block list")
{
    TempDir dir;
    auto source = dir / "empty.bin";
    azupload_test::writeFile(source, {});

    FakeBlockStore remote;
    RestartStore store;
    UploadExecutor executor(remote, store, optionsWithBlockSize(100));

    REQUIRE(executor.run(source).completed());
    CHECK(remote.putBlockCalls.empty());
    REQUIRE(remote.putBlockListCalls.size() == 1);
    CHECK(remote.putBlockListCalls[0].empty());
    CHECK_FALSE(store.exists(source));
}

TEST_CASE("Corrupt restart record aborts without transferring anything")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));
    azupload_test::writeText(RestartStore::restartPathFor(source), "{\"currentBlockId\": ");

    FakeBlockStore remote;
    RestartStore store;
    UploadExecutor executor(remote, store, optionsWithBlockSize(100));

    CHECK(runFailureKind(executor, source) == ErrorKind::RestartRecord);
    CHECK(remote.putBlockCalls.empty());
    CHECK(remote.putBlockListCalls.empty());
    CHECK(std::filesystem::exists(RestartStore::restartPathFor(source)));
}

TEST_CASE("Record written for a different file size is refused")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));

    FakeBlockStore remote;
    RestartStore store;
    remote.failPutBlockCalls = {1};
    UploadExecutor executor(remote, store, optionsWithBlockSize(100));
    REQUIRE(executor.run(source).status == UploadStatus::TransferFailed);

    azupload_test::writeFile(source, azupload_test::patternBytes(300));
    size_t callsBefore = remote.putBlockCalls.size();
    CHECK(runFailureKind(executor, source) == ErrorKind::RestartRecord);
    CHECK(remote.putBlockCalls.size() == callsBefore);
}

TEST_CASE("Hand-edited record pointing past the last block is refused before any transfer")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));

    RestartState edited;
    edited.fileSize = 250;
    edited.blockSize = 1ULL << 63;
    edited.currentBlockNumber = 2;
    edited.committedBlockIds = idsFor(2);
    edited.remainingBytes = 250;

    FakeBlockStore remote;
    RestartStore store;
    store.save(edited, source);
    UploadExecutor executor(remote, store, optionsWithBlockSize(100));

    CHECK(runFailureKind(executor, source) == ErrorKind::RestartRecord);
    CHECK(remote.putBlockCalls.empty());
    CHECK(remote.putBlockListCalls.empty());
}

TEST_CASE("Resume keeps the recorded block size even if the configuration changed")
{
    TempDir dir;
    auto source = dir / "big.bin";
    auto bytes = azupload_test::patternBytes(250);
    azupload_test::writeFile(source, bytes);

    FakeBlockStore remote;
    RestartStore store;
    remote.failPutBlockCalls = {1};
    {
        UploadExecutor executor(remote, store, optionsWithBlockSize(100));
        REQUIRE(executor.run(source).status == UploadStatus::TransferFailed);
    }

    UploadExecutor resumed(remote, store, optionsWithBlockSize(64));
    REQUIRE(resumed.run(source).completed());
    CHECK(remote.committedIds() == idsFor(3));
    CHECK(remote.committedContent() == bytes);
}

TEST_CASE("Source that shrinks mid-upload is a local read error")
{
    TempDir dir;
    auto source = dir / "big.bin";
    azupload_test::writeFile(source, azupload_test::patternBytes(250));

    FakeBlockStore remote;
    RestartStore store;
    remote.afterPutBlock = [&](const FakeBlockStore::PutBlockCall &)
    {
        std::filesystem::resize_file(source, 120);
    };
    UploadExecutor executor(remote, store, optionsWithBlockSize(100));

    CHECK(runFailureKind(executor, source) == ErrorKind::LocalRead);
    CHECK(remote.putBlockListCalls.empty());
    CHECK(store.exists(source));
}

TEST_CASE("Stop request between blocks persists a clean boundary")
{
    TempDir dir;
    auto source = dir / "big.bin";
    auto bytes = azupload_test::patternBytes(250);
    azupload_test::writeFile(source, bytes);

    std::atomic<bool> stop{false};
    FakeBlockStore remote;
    RestartStore store;
    remote.afterPutBlock = [&](const FakeBlockStore::PutBlockCall &)
    { stop.store(true); };

    ExecutorOptions options = optionsWithBlockSize(100);
    options.stopRequested = &stop;
    UploadExecutor executor(remote, store, options);

    UploadResult cancelled = executor.run(source);
    REQUIRE(cancelled.status == UploadStatus::Cancelled);
    CHECK(remote.putBlockCalls.size() == 1);

    auto record = store.load(source);
    REQUIRE(record.has_value());
    CHECK(record->committedBlockIds == idsFor(1));
    CHECK_FALSE(record->inFlight());
    CHECK(record->remainingBytes == 150);

    stop.store(false);
    remote.afterPutBlock = nullptr;
    REQUIRE(executor.run(source).completed());
    CHECK(remote.committedIds() == idsFor(3));
    CHECK(remote.committedContent() == bytes);
}
