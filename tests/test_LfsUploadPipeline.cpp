//Catch includes
#include <catch2/catch_test_macros.hpp>

//Qt includes
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

//Std includes
#include <algorithm>

//Async includes
#include "asyncfuture.h"

//Our includes
#include "HashUtilities.h"
#include "LfsBatchClient.h"
#include "LfsUploadPipeline.h"
#include "TransferError.h"
#include "TestUtilities.h"
#include "ArchiveBuilder.h"
#include "hub/HubServer.h"

using namespace HubTransfer;

namespace {

const RepoRef Repo(QStringLiteral("owner/model"));

struct UploadFixture {
    HubServer server;
    QDir workDir;
    HubSettings settings;

    UploadFixture()
    {
        REQUIRE(server.start());
        workDir = TestUtilities::createUniqueTempDir();
        settings = TestUtilities::settingsFor(server, QDir(workDir.filePath(QStringLiteral("cache"))));
        settings.setLargeFileThreshold(1024);
    }

    UploadUnit unit(const QString& name, const QByteArray& content) const
    {
        const QString path = workDir.filePath(name);
        REQUIRE(ArchiveBuilder::writeFile(path, content));
        auto unit = UploadUnit::fromFile(path, name);
        REQUIRE(!unit.hasError());
        return unit.value();
    }
};

const UploadUnit& unitFor(const UploadResult& result, const QString& pathInRepo)
{
    for (const auto& unit : result.units) {
        if (unit.pathInRepo() == pathInRepo) {
            return unit;
        }
    }
    FAIL("No unit for " << pathInRepo.toStdString());
    return result.units.first();
}

}

TEST_CASE("Upload units hash their content", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    const QByteArray content = ArchiveBuilder::randomBytes(5000, 31);
    const UploadUnit unit = fixture.unit(QStringLiteral("weights.bin"), content);

    CHECK(unit.oid() == HashUtilities::sha256Hex(content));
    CHECK(unit.size() == content.size());
    CHECK(unit.sample() == content.left(UploadUnit::SampleBytes));
    CHECK(unit.state() == UploadUnit::State::Planned);
    CHECK(unit.mode() == UploadUnit::Mode::SinglePart);

    UploadUnit split = unit;
    split.splitIntoChunks(2000);
    CHECK(split.mode() == UploadUnit::Mode::Multipart);
    REQUIRE(split.chunks().size() == 3);
    CHECK(split.chunks().at(0).partNumber == 1);
    CHECK(split.chunks().at(2).offset == 4000);
    CHECK(split.chunks().at(2).length == 1000);
    CHECK_FALSE(split.allChunksDone());
    for (const auto& chunk : split.chunks()) {
        split.markChunkDone(chunk.partNumber, QStringLiteral("etag"));
    }
    CHECK(split.allChunksDone());

    CHECK(UploadUnit::fromFile(fixture.workDir.filePath(QStringLiteral("missing")), QStringLiteral("missing")).hasError());
}

TEST_CASE("Planning splits files at the threshold", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    fixture.unit(QStringLiteral("small.txt"), QByteArray(1023, 'a'));
    fixture.unit(QStringLiteral("exact.bin"), QByteArray(1024, 'b'));
    fixture.unit(QStringLiteral("large.bin"), QByteArray(4096, 'c'));

    QVector<UploadFile> files;
    for (const auto& name : {"small.txt", "exact.bin", "large.bin"}) {
        files.append({fixture.workDir.filePath(QString::fromLatin1(name)), QString::fromLatin1(name)});
    }

    LfsUploadPipeline pipeline(fixture.settings);
    const auto planned = pipeline.plan(files);
    REQUIRE(!planned.hasError());
    REQUIRE(planned.value().regularFiles.size() == 1);
    CHECK(planned.value().regularFiles.first().pathInRepo == QStringLiteral("small.txt"));
    REQUIRE(planned.value().units.size() == 2);
    CHECK(planned.value().units.at(0).pathInRepo() == QStringLiteral("exact.bin"));
    CHECK(planned.value().units.at(1).pathInRepo() == QStringLiteral("large.bin"));

    files.append({fixture.workDir.filePath(QStringLiteral("nope.bin")), QStringLiteral("nope.bin")});
    const auto missing = pipeline.plan(files);
    REQUIRE(missing.hasError());
    CHECK(missing.errorCode() == errorCode(TransferErrorCode::Io));

    //Nothing was contacted while planning
    CHECK(fixture.server.requests().isEmpty());
}

TEST_CASE("Single part uploads negotiate once and skip what the hub has", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    const QByteArray shared = ArchiveBuilder::randomBytes(3000, 32);
    const QByteArray present = ArchiveBuilder::randomBytes(3000, 33);

    QVector<UploadUnit> units;
    units.append(fixture.unit(QStringLiteral("a.bin"), shared));
    units.append(fixture.unit(QStringLiteral("copy-of-a.bin"), shared));
    units.append(fixture.unit(QStringLiteral("present.bin"), present));
    fixture.server.setPresentOid(HashUtilities::sha256Hex(present));

    LfsUploadPipeline pipeline(fixture.settings);
    auto future = pipeline.upload(Repo, units);
    REQUIRE(AsyncFuture::waitForFinished(future, 60 * 1000));
    const UploadResult result = future.result();

    CHECK(!result.overall().hasError());
    CHECK(result.failedCount() == 0);
    CHECK(unitFor(result, QStringLiteral("a.bin")).state() == UploadUnit::State::Verified);
    CHECK(unitFor(result, QStringLiteral("copy-of-a.bin")).state() == UploadUnit::State::AlreadyPresent);
    CHECK(unitFor(result, QStringLiteral("present.bin")).state() == UploadUnit::State::AlreadyPresent);

    CHECK(fixture.server.requestCount("PUT", "/upload/") == 1);
    CHECK(fixture.server.uploadedObject(HashUtilities::sha256Hex(shared)) == shared);

    //One batch naming each oid once
    const auto batches = fixture.server.batchBodies();
    REQUIRE(batches.size() == 1);
    const QJsonObject batch = QJsonDocument::fromJson(batches.first()).object();
    CHECK(batch.value(QStringLiteral("operation")).toString() == QStringLiteral("upload"));
    CHECK(batch.value(QStringLiteral("hash_algo")).toString() == QStringLiteral("sha256"));
    CHECK(batch.value(QStringLiteral("transfers")).toArray().contains(QStringLiteral("multipart")));
    CHECK(batch.value(QStringLiteral("objects")).toArray().size() == 2);

    //Only the batch request carries the token
    for (const auto& request : fixture.server.requests()) {
        if (request.path.endsWith("/objects/batch")) {
            CHECK(request.header("authorization") == QByteArrayLiteral("Bearer test-token"));
            CHECK(request.header("accept") == LfsBatchClient::LfsMediaType);
        } else {
            CHECK(request.header("authorization").isEmpty());
        }
    }
}

TEST_CASE("Multipart uploads complete with parts in ascending order", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    const QByteArray content = ArchiveBuilder::randomBytes(10 * 1000 + 123, 34);
    const QString oid = HashUtilities::sha256Hex(content);

    fixture.server.setMultipartChunkSize(1000);
    fixture.server.setUseAmzPartHeaders(GENERATE(false, true));

    //Early parts answer last
    fixture.server.setPartDelayMs(1, 300);
    fixture.server.setPartDelayMs(2, 200);
    fixture.server.setPartDelayMs(3, 100);

    fixture.settings.setMaxWorkers(4);
    LfsUploadPipeline pipeline(fixture.settings);

    QVector<UploadUnit> units;
    units.append(fixture.unit(QStringLiteral("big.bin"), content));

    QVector<qint64> reported;
    const UploadResult result = pipeline.uploadBlocking(Repo, units, [&reported](const ProgressState& state) {
        reported.append(state.current());
    });

    REQUIRE(!result.overall().hasError());
    const UploadUnit& unit = result.units.first();
    CHECK(unit.state() == UploadUnit::State::Verified);
    CHECK(unit.mode() == UploadUnit::Mode::Multipart);
    CHECK(unit.chunks().size() == 11);
    CHECK(unit.allChunksDone());

    const QMap<int, QByteArray> parts = fixture.server.uploadedParts(oid);
    REQUIRE(parts.size() == 11);
    QByteArray reassembled;
    for (const auto& part : parts) {
        reassembled += part;
    }
    CHECK(reassembled == content);

    const auto completions = fixture.server.completionBodies();
    REQUIRE(completions.size() == 1);
    const QJsonObject completion = QJsonDocument::fromJson(completions.first()).object();
    CHECK(completion.value(QStringLiteral("oid")).toString() == oid);
    const QJsonArray completedParts = completion.value(QStringLiteral("parts")).toArray();
    REQUIRE(completedParts.size() == 11);
    for (int i = 0; i < completedParts.size(); ++i) {
        const QJsonObject part = completedParts.at(i).toObject();
        CHECK(part.value(QStringLiteral("partNumber")).toInt() == i + 1);
        CHECK(part.value(QStringLiteral("etag")).toString().startsWith(QStringLiteral("part-%1-").arg(i + 1)));
    }

    REQUIRE(!reported.isEmpty());
    CHECK(reported.last() == content.size());
    CHECK(std::is_sorted(reported.begin(), reported.end()));
}

TEST_CASE("One failing object does not stop the others", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    fixture.server.setVerifyEnabled(true);

    const QByteArray good = ArchiveBuilder::randomBytes(2000, 35);
    const QByteArray unverified = ArchiveBuilder::randomBytes(2000, 36);
    const QByteArray rejected = ArchiveBuilder::randomBytes(2000, 37);
    const QByteArray omitted = ArchiveBuilder::randomBytes(2000, 38);
    fixture.server.setVerifyFailure(HashUtilities::sha256Hex(unverified));
    fixture.server.setObjectError(HashUtilities::sha256Hex(rejected), 422, QStringLiteral("object too large"));
    fixture.server.setOmittedOid(HashUtilities::sha256Hex(omitted));

    QVector<UploadUnit> units;
    units.append(fixture.unit(QStringLiteral("good.bin"), good));
    units.append(fixture.unit(QStringLiteral("unverified.bin"), unverified));
    units.append(fixture.unit(QStringLiteral("rejected.bin"), rejected));
    units.append(fixture.unit(QStringLiteral("omitted.bin"), omitted));
    units.append(fixture.unit(QStringLiteral("copy-of-unverified.bin"), unverified));

    LfsUploadPipeline pipeline(fixture.settings);
    const UploadResult result = pipeline.uploadBlocking(Repo, units);

    CHECK(result.failedCount() == 4);
    const auto overall = result.overall();
    REQUIRE(overall.hasError());
    CHECK(overall.errorCode() == errorCode(TransferErrorCode::PartialBatchFailure));

    CHECK(unitFor(result, QStringLiteral("good.bin")).state() == UploadUnit::State::Verified);
    CHECK(fixture.server.requestCount("POST", "/verify/") == 2);

    const UploadUnit& failedVerify = unitFor(result, QStringLiteral("unverified.bin"));
    CHECK(failedVerify.state() == UploadUnit::State::Failed);
    CHECK(failedVerify.errorCode() == errorCode(TransferErrorCode::Protocol));
    CHECK(unitFor(result, QStringLiteral("copy-of-unverified.bin")).errorCode() == failedVerify.errorCode());

    const UploadUnit& rejectedUnit = unitFor(result, QStringLiteral("rejected.bin"));
    CHECK(rejectedUnit.state() == UploadUnit::State::Failed);
    CHECK(rejectedUnit.errorMessage().contains(QStringLiteral("object too large")));
    CHECK(rejectedUnit.errorCode() == errorCode(TransferErrorCode::Protocol));

    CHECK(unitFor(result, QStringLiteral("omitted.bin")).errorCode() == errorCode(TransferErrorCode::Protocol));
    CHECK(fixture.server.uploadedObject(HashUtilities::sha256Hex(rejected)).isEmpty());
}

TEST_CASE("A failed negotiation fails every unit", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    fixture.settings.setEndpoint(QUrl(QStringLiteral("http://127.0.0.1:1")));
    fixture.settings.setMaxRetries(0);

    QVector<UploadUnit> units;
    units.append(fixture.unit(QStringLiteral("a.bin"), ArchiveBuilder::randomBytes(2000, 39)));
    units.append(fixture.unit(QStringLiteral("b.bin"), ArchiveBuilder::randomBytes(2000, 40)));

    LfsUploadPipeline pipeline(fixture.settings);
    const UploadResult result = pipeline.uploadBlocking(Repo, units);
    CHECK(result.failedCount() == 2);
    CHECK(result.overall().errorCode() == errorCode(TransferErrorCode::NetworkFailure));

    auto empty = pipeline.upload(Repo, {});
    REQUIRE(AsyncFuture::waitForFinished(empty, 1000));
    CHECK(empty.result().units.isEmpty());
}

TEST_CASE("A part that never answers fails its unit with a timeout", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    const QByteArray content = ArchiveBuilder::randomBytes(3000, 41);

    fixture.server.setMultipartChunkSize(1000);
    fixture.server.setPartDelayMs(2, 3000);
    fixture.settings.setRequestTimeoutMs(300);
    fixture.settings.setMaxRetries(0);

    LfsUploadPipeline pipeline(fixture.settings);
    QVector<UploadUnit> units;
    units.append(fixture.unit(QStringLiteral("slow.bin"), content));

    const UploadResult result = pipeline.uploadBlocking(Repo, units);
    REQUIRE(result.units.size() == 1);
    const UploadUnit& unit = result.units.first();
    CHECK(unit.state() == UploadUnit::State::Failed);
    CHECK(unit.errorCode() == errorCode(TransferErrorCode::Timeout));
    CHECK(unit.errorMessage().contains(QStringLiteral("Part 2")));

    CHECK(fixture.server.requestCount("PUT", "/parts/") == 3);
    CHECK(fixture.server.completionBodies().isEmpty());
    CHECK(result.overall().hasError());
}

TEST_CASE("Destroying the pipeline waits for a running upload", "[LfsUploadPipeline]")
{
    UploadFixture fixture;
    fixture.server.setMultipartChunkSize(1000);
    fixture.server.setPartDelayMs(1, 200);
    const QByteArray content = ArchiveBuilder::randomBytes(2500, 42);

    QVector<UploadUnit> units;
    units.append(fixture.unit(QStringLiteral("pending.bin"), content));

    QFuture<UploadResult> future;
    {
        LfsUploadPipeline pipeline(fixture.settings);
        future = pipeline.upload(Repo, units);
    }

    REQUIRE(future.isFinished());
    const UploadResult result = future.result();
    REQUIRE(result.units.size() == 1);
    CHECK(result.units.first().state() == UploadUnit::State::Verified);
    CHECK(fixture.server.completionBodies().size() == 1);
}

TEST_CASE("Batch protocol documents are built and parsed", "[LfsBatchClient]")
{
    LfsBatchClient client(nullptr, QUrl(QStringLiteral("https://hub.example")));
    CHECK(client.batchUrl(Repo).toString()
          == QStringLiteral("https://hub.example/owner/model.git/info/lfs/objects/batch"));
    CHECK(client.batchUrl(RepoRef(QStringLiteral("owner/set"), RepoRef::Type::Dataset)).toString()
          == QStringLiteral("https://hub.example/datasets/owner/set.git/info/lfs/objects/batch"));

    SECTION("Completion parts are sorted") {
        QVector<UploadChunk> chunks;
        for (int part : {3, 1, 2}) {
            UploadChunk chunk;
            chunk.partNumber = part;
            chunk.etag = QStringLiteral("e%1").arg(part);
            chunk.done = true;
            chunks.append(chunk);
        }
        const QJsonObject body = QJsonDocument::fromJson(LfsBatchClient::buildCompletionBody(QStringLiteral("abc"), chunks)).object();
        CHECK(body.value(QStringLiteral("oid")).toString() == QStringLiteral("abc"));
        const QJsonArray parts = body.value(QStringLiteral("parts")).toArray();
        REQUIRE(parts.size() == 3);
        for (int i = 0; i < 3; ++i) {
            CHECK(parts.at(i).toObject().value(QStringLiteral("partNumber")).toInt() == i + 1);
            CHECK(parts.at(i).toObject().value(QStringLiteral("etag")).toString() == QStringLiteral("e%1").arg(i + 1));
        }
    }

    SECTION("Responses with actions, errors and numeric headers") {
        const QByteArray json = R"({
            "transfer": "multipart",
            "objects": [
                {"oid": "aaa", "size": 10,
                 "actions": {"upload": {"href": "https://s3.example/complete",
                                        "header": {"chunk_size": 4, "1": "https://s3.example/p1",
                                                   "2": "https://s3.example/p2", "3": "https://s3.example/p3"}},
                             "verify": {"href": "https://hub.example/verify", "header": {"X-Token": "t"}}}},
                {"oid": "bbb", "size": 5},
                {"oid": "ccc", "size": 5, "error": {"code": 404, "message": "missing"}},
                {"oid": "ddd", "size": 5, "error": {"code": 422, "message": "bad"}}
            ]
        })";

        const auto parsed = LfsBatchClient::parseBatchResponse(json);
        REQUIRE(!parsed.hasError());
        CHECK(parsed.value().transfer == QStringLiteral("multipart"));
        REQUIRE(parsed.value().objects.size() == 4);

        const auto* a = parsed.value().find(QStringLiteral("aaa"));
        REQUIRE(a != nullptr);
        CHECK(a->hasAction(QStringLiteral("upload")));
        CHECK(a->hasAction(QStringLiteral("verify")));
        const LfsBatchClient::Action upload = a->actions.value(QStringLiteral("upload"));
        CHECK(LfsBatchClient::chunkSize(upload) == 4);
        const QMap<int, QUrl> urls = LfsBatchClient::partUrls(upload);
        CHECK(urls.keys() == QList<int>({1, 2, 3}));
        CHECK(urls.value(2) == QUrl(QStringLiteral("https://s3.example/p2")));

        const auto* b = parsed.value().find(QStringLiteral("bbb"));
        REQUIRE(b != nullptr);
        CHECK_FALSE(b->hasAction(QStringLiteral("upload")));
        CHECK_FALSE(b->hasError());

        CHECK(parsed.value().find(QStringLiteral("ccc"))->errorCode == errorCode(TransferErrorCode::NotFound));
        CHECK(parsed.value().find(QStringLiteral("ddd"))->errorCode == errorCode(TransferErrorCode::Protocol));
        CHECK(parsed.value().find(QStringLiteral("eee")) == nullptr);

        CHECK(LfsBatchClient::parseBatchResponse(QByteArrayLiteral("not json")).hasError());
    }

    SECTION("Amazon style part headers") {
        LfsBatchClient::Action action;
        action.headers.insert(QByteArrayLiteral("X-Amz-Meta-Chunk-Size"), QByteArrayLiteral("1048576"));
        action.headers.insert(QByteArrayLiteral("x-amz-meta-part-2-url"), QByteArrayLiteral("https://s3.example/p2"));
        action.headers.insert(QByteArrayLiteral("x-amz-meta-part-1-url"), QByteArrayLiteral("https://s3.example/p1"));
        CHECK(LfsBatchClient::chunkSize(action) == 1048576);
        CHECK(LfsBatchClient::partUrls(action).keys() == QList<int>({1, 2}));

        CHECK(LfsBatchClient::chunkSize(LfsBatchClient::Action()) == -1);
    }
}
