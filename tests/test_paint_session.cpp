#include <MiniPainter/PaintSession.hpp>
#include "StlFixtures.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>

using namespace MiniPainter;
using namespace MiniPainter::fixtures;

namespace {

// In-process oracle: answers with whatever the test installs, optionally
// holding the call until the test releases it.
class FakeOracle : public ISegmentationOracle {
public:
    using Handler = std::function<SegmentationOutcome(const SegmentationRequest&)>;

    FakeOracle() {
        health.reachable = true;
        health.status = "healthy";
    }

    HealthStatus probeHealth() override {
        ++healthCalls;
        return health;
    }

    SegmentationOutcome segment(const SegmentationRequest& request) override {
        int call = segmentCalls++;
        {
            std::lock_guard<std::mutex> lk(mutex);
            lastRequest = request;
        }
        std::shared_future<void> g;
        Handler h;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (call == 0 && firstCallGate.valid()) g = firstCallGate;
            h = handler;
        }
        if (g.valid()) g.wait();
        SegmentationOutcome out = h ? h(request) : SegmentationOutcome::Success({});
        ++completedCalls;
        return out;
    }

    void setHandler(Handler h) {
        std::lock_guard<std::mutex> lk(mutex);
        handler = std::move(h);
    }

    void holdFirstCall(std::shared_future<void> gate) {
        std::lock_guard<std::mutex> lk(mutex);
        firstCallGate = std::move(gate);
    }

    SegmentationRequest request() {
        std::lock_guard<std::mutex> lk(mutex);
        return lastRequest;
    }

    HealthStatus health;
    std::atomic<int> healthCalls{0};
    std::atomic<int> segmentCalls{0};
    std::atomic<int> completedCalls{0};

private:
    std::mutex mutex;
    Handler handler;
    std::shared_future<void> firstCallGate;
    SegmentationRequest lastRequest;
};

OracleRegion oracleRegion(const std::string& id, std::vector<int64_t> indices, const char* hex = nullptr) {
    OracleRegion r;
    r.id = id;
    r.name = titleCase(id);
    r.canonicalIndices = std::move(indices);
    if (hex) r.hasColor = parseHexColor(hex, r.color);
    return r;
}

// Two overlapping regions covering the cube: top {0..5}, bottom {5, 6, 7}
SegmentationOutcome twoRegions(const SegmentationRequest&) {
    return SegmentationOutcome::Success({oracleRegion("top", {0, 1, 2, 3, 4, 5}, "#FF0000"),
                                         oracleRegion("bottom", {5, 6, 7}, "#0000FF")});
}

const std::chrono::milliseconds kWait(5000);

} // namespace

class PaintSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        oracle = std::make_shared<FakeOracle>();
        oracle->setHandler(twoRegions);
        session.reset(new PaintSession(oracle));
    }

    void TearDown() override {
        release.set_value();
        session.reset();
    }

    // Upload the cube and wait for its regions to be installed
    void loadCube(const std::string& name = "cube.stl") {
        ASSERT_EQ(session->beginUpload(cubeStl(), name), PaintSession::UploadStatus::Started);
        ASSERT_TRUE(session->waitForPending(kWait));
        ASSERT_FALSE(session->currentError().isError()) << session->currentError().describe();
    }

    std::shared_ptr<FakeOracle> oracle;
    std::unique_ptr<PaintSession> session;
    std::promise<void> release;
};

TEST_F(PaintSessionTest, StartsWithoutModel) {
    EXPECT_FALSE(session->hasModel());
    EXPECT_TRUE(session->paintState().empty());
    EXPECT_TRUE(session->colorBuffer().empty());
    EXPECT_FALSE(session->hasPending());
    EXPECT_FALSE(session->uploadEnabled());
    EXPECT_FALSE(session->snapshot().hasModel());
}

TEST_F(PaintSessionTest, HealthProbeEnablesUpload) {
    EXPECT_TRUE(session->probeHealth().reachable);
    EXPECT_TRUE(session->oracleReachable());
    EXPECT_TRUE(session->uploadEnabled());
}

TEST_F(PaintSessionTest, UploadInstallsRegionsAndColors) {
    loadCube();
    ASSERT_TRUE(session->hasModel());
    const LoadedModel* model = session->model();
    EXPECT_EQ(model->name, "cube.stl");
    EXPECT_EQ(model->stats.triangles, 12u);
    EXPECT_EQ(model->stats.rawVertices, 36u);
    EXPECT_EQ(model->stats.uniqueVertices, 8u);
    EXPECT_FLOAT_EQ(model->stats.bounds.maxExtent(), 5.0f);

    EXPECT_EQ(oracle->request().vertices.size(), 8u);
    EXPECT_EQ(oracle->request().endpoint(), "/segment");

    const auto& regions = session->paintState().regions();
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].id, "top");
    EXPECT_EQ(session->selectedRegion(), "top");
    EXPECT_EQ(session->colorBuffer().size(), 36u * 3);

    // bottom is later in the list, so it owns the shared canonical vertex 5
    const ColorBuffer& buf = session->colorBuffer();
    for (uint32_t raw : model->table.reverseMap[5]) {
        EXPECT_FLOAT_EQ(buf[raw * 3 + 2], 1.0f);
        EXPECT_FLOAT_EQ(buf[raw * 3 + 0], 0.0f);
    }
}

TEST_F(PaintSessionTest, MissingColorsComeFromPaletteByPosition) {
    oracle->setHandler([](const SegmentationRequest&) {
        return SegmentationOutcome::Success({oracleRegion("a", {0}), oracleRegion("b", {1}, "#123456"),
                                             oracleRegion("c", {2})});
    });
    loadCube();
    const auto& regions = session->paintState().regions();
    ASSERT_EQ(regions.size(), 3u);
    EXPECT_EQ(regions[0].baseColor, paletteColorAt(0));
    EXPECT_EQ(toHexColor(regions[1].baseColor), "#123456");
    EXPECT_EQ(regions[2].baseColor, paletteColorAt(2));
}

TEST_F(PaintSessionTest, ProfileIsForwardedToOracle) {
    SessionOptions opts;
    opts.profile = "creature";
    opts.detailLevel = "high";
    opts.normalize = false;
    session.reset(new PaintSession(oracle, opts));
    loadCube();
    SegmentationRequest req = oracle->request();
    EXPECT_EQ(req.endpoint(), "/segment-advanced");
    EXPECT_EQ(req.profile, "creature");
    EXPECT_EQ(req.detailLevel, "high");
    EXPECT_FLOAT_EQ(session->model()->stats.bounds.maxExtent(), 1.0f);
}

TEST_F(PaintSessionTest, DecodeFailureLeavesPreviousModel) {
    loadCube();
    ColorBuffer before = session->colorBuffer();
    int calls = oracle->segmentCalls.load();

    std::string text = "solid x\nendsolid x\n";
    auto status = session->beginUpload(std::vector<uint8_t>(text.begin(), text.end()), "ascii.stl");
    EXPECT_EQ(status, PaintSession::UploadStatus::DecodeFailed);
    EXPECT_EQ(session->currentError().kind, ErrorKind::FormatError);
    EXPECT_FALSE(session->hasPending());
    EXPECT_EQ(oracle->segmentCalls.load(), calls);

    auto truncated = cubeStl();
    truncated.resize(100);
    EXPECT_EQ(session->beginUpload(truncated, "cut.stl"), PaintSession::UploadStatus::DecodeFailed);
    EXPECT_EQ(session->currentError().kind, ErrorKind::TruncatedError);

    EXPECT_EQ(session->model()->name, "cube.stl");
    EXPECT_EQ(session->colorBuffer(), before);
}

TEST_F(PaintSessionTest, BackendFailureKeepsPaintedModel) {
    loadCube();
    ASSERT_TRUE(session->setOverrideColor("top", colorFromRgb24(0xFFD700)));
    ASSERT_TRUE(session->setVisibility("bottom", false));
    ColorBuffer before = session->colorBuffer();
    uint64_t snapshotGeneration = session->snapshot().generation;

    oracle->setHandler([](const SegmentationRequest&) {
        return SegmentationOutcome::Failure(ErrorKind::BackendUnavailable, "connection refused");
    });
    ASSERT_EQ(session->beginUpload(cubeStl(2.0f), "other.stl"), PaintSession::UploadStatus::Started);
    ASSERT_TRUE(session->waitForPending(kWait));

    EXPECT_EQ(session->currentError().kind, ErrorKind::BackendUnavailable);
    EXPECT_FALSE(session->oracleReachable());
    EXPECT_FALSE(session->uploadEnabled());
    EXPECT_EQ(session->model()->name, "cube.stl");
    EXPECT_EQ(session->colorBuffer(), before);
    EXPECT_NE(session->paintState().overrideFor("top"), nullptr);
    EXPECT_FALSE(session->paintState().findRegion("bottom")->visible);
    EXPECT_EQ(session->snapshot().generation, snapshotGeneration);
}

TEST_F(PaintSessionTest, RetryAfterBackendFailureProbesAgain) {
    oracle->setHandler([](const SegmentationRequest&) {
        return SegmentationOutcome::Failure(ErrorKind::BackendUnavailable, "timeout");
    });
    ASSERT_EQ(session->beginUpload(cubeStl(), "cube.stl"), PaintSession::UploadStatus::Started);
    ASSERT_TRUE(session->waitForPending(kWait));
    EXPECT_FALSE(session->oracleReachable());

    oracle->setHandler(twoRegions);
    int probes = oracle->healthCalls.load();
    loadCube();
    EXPECT_GT(oracle->healthCalls.load(), probes);
    EXPECT_TRUE(session->hasModel());
}

TEST_F(PaintSessionTest, UnreachableOracleRejectsUpload) {
    oracle->health.reachable = false;
    oracle->health.error = "oracle unreachable";
    EXPECT_EQ(session->beginUpload(cubeStl(), "cube.stl"), PaintSession::UploadStatus::BackendOffline);
    EXPECT_EQ(session->currentError().kind, ErrorKind::BackendUnavailable);
    EXPECT_EQ(oracle->segmentCalls.load(), 0);
    EXPECT_FALSE(session->hasPending());
}

TEST_F(PaintSessionTest, SegmentationAndProtocolErrorsDoNotTouchState) {
    loadCube();
    ColorBuffer before = session->colorBuffer();

    oracle->setHandler([](const SegmentationRequest&) {
        return parseSegmentationResponse(200, R"({"success": false, "error": "Too few vertices"})");
    });
    ASSERT_EQ(session->beginUpload(cubeStl(), "b.stl"), PaintSession::UploadStatus::Started);
    ASSERT_TRUE(session->waitForPending(kWait));
    EXPECT_EQ(session->currentError().kind, ErrorKind::SegmentationError);
    EXPECT_EQ(session->currentError().message, "Too few vertices");
    EXPECT_TRUE(session->oracleReachable());

    oracle->setHandler([](const SegmentationRequest&) {
        return parseSegmentationResponse(200, R"({"success": true, "regions": [{"id": "x"}]})");
    });
    ASSERT_EQ(session->beginUpload(cubeStl(), "c.stl"), PaintSession::UploadStatus::Started);
    ASSERT_TRUE(session->waitForPending(kWait));
    EXPECT_EQ(session->currentError().kind, ErrorKind::ProtocolError);

    EXPECT_EQ(session->model()->name, "cube.stl");
    EXPECT_EQ(session->paintState().regions().size(), 2u);
    EXPECT_EQ(session->colorBuffer(), before);
}

TEST_F(PaintSessionTest, SecondUploadIsRejectedWhilePending) {
    oracle->holdFirstCall(release.get_future().share());
    ASSERT_EQ(session->beginUpload(cubeStl(), "first.stl"), PaintSession::UploadStatus::Started);
    EXPECT_TRUE(session->hasPending());
    EXPECT_FALSE(session->uploadEnabled());
    EXPECT_FALSE(session->poll());

    EXPECT_EQ(session->beginUpload(cubeStl(), "second.stl"), PaintSession::UploadStatus::Busy);
    EXPECT_LE(oracle->segmentCalls.load(), 1);

    release.set_value();
    release = std::promise<void>();
    ASSERT_TRUE(session->waitForPending(kWait));
    EXPECT_EQ(session->model()->name, "first.stl");
    EXPECT_TRUE(session->uploadEnabled());
}

TEST_F(PaintSessionTest, AbandonedResultIsDiscarded) {
    // The held first call answers with twoRegions once released
    oracle->holdFirstCall(release.get_future().share());
    ASSERT_EQ(session->beginUpload(cubeStl(), "stale.stl"), PaintSession::UploadStatus::Started);
    uint64_t staleGeneration = session->generation();
    session->abandonPending();
    EXPECT_FALSE(session->hasPending());
    EXPECT_GT(session->generation(), staleGeneration);

    oracle->setHandler([](const SegmentationRequest&) {
        return SegmentationOutcome::Success({oracleRegion("fresh", {0, 1})});
    });
    ASSERT_EQ(session->beginUpload(cubeStl(), "fresh.stl"), PaintSession::UploadStatus::Started);
    ASSERT_TRUE(session->waitForPending(kWait));
    EXPECT_EQ(session->model()->name, "fresh.stl");
    uint64_t installed = session->snapshot().generation;
    EXPECT_GT(installed, staleGeneration);

    release.set_value();
    release = std::promise<void>();
    // Let the stale call finish and get reaped; nothing may change
    for (int i = 0; i < 500 && oracle->completedCalls.load() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(oracle->completedCalls.load(), 2);
    EXPECT_FALSE(session->poll());
    ASSERT_EQ(session->paintState().regions().size(), 1u);
    EXPECT_EQ(session->paintState().regions()[0].id, "fresh");
    EXPECT_EQ(session->snapshot().generation, installed);
}

TEST_F(PaintSessionTest, NewModelResetsOverridesAndVisibility) {
    loadCube("first.stl");
    session->setOverrideColor("top", Color(1.0f));
    session->setVisibility("bottom", false);
    loadCube("second.stl");
    EXPECT_TRUE(session->paintState().overrides().empty());
    EXPECT_TRUE(session->paintState().findRegion("bottom")->visible);
    EXPECT_EQ(session->model()->name, "second.stl");
}

TEST_F(PaintSessionTest, MutationsRecompositeAndUnknownIdsAreRejected) {
    loadCube();
    ColorBuffer base = session->colorBuffer();

    EXPECT_FALSE(session->setVisibility("tail", false));
    EXPECT_FALSE(session->setOverrideColor("tail", Color(1.0f)));
    EXPECT_FALSE(session->toggleVisibility("tail"));
    EXPECT_FALSE(session->clearOverride("tail"));
    EXPECT_FALSE(session->moveRegion("tail", 0));
    EXPECT_FALSE(session->selectRegion("tail"));
    EXPECT_EQ(session->colorBuffer(), base);

    ASSERT_TRUE(session->setOverrideColor("top", colorFromRgb24(0x228B22)));
    EXPECT_NE(session->colorBuffer(), base);
    ASSERT_TRUE(session->clearOverride("top"));
    EXPECT_EQ(session->colorBuffer(), base);

    ASSERT_TRUE(session->toggleVisibility("top"));
    ASSERT_TRUE(session->toggleVisibility("top"));
    EXPECT_EQ(session->colorBuffer(), base);

    ASSERT_TRUE(session->setOverrideColor("bottom", Color(1.0f)));
    session->clearOverrides();
    EXPECT_EQ(session->colorBuffer(), base);

    ASSERT_TRUE(session->selectRegion("bottom"));
    EXPECT_EQ(session->selectedRegion(), "bottom");
}

TEST_F(PaintSessionTest, MoveRegionFlipsOverlapWinner) {
    loadCube();
    const LoadedModel* model = session->model();
    uint32_t shared = model->table.reverseMap[5].front();
    EXPECT_FLOAT_EQ(session->colorBuffer()[shared * 3 + 2], 1.0f);

    ASSERT_TRUE(session->moveRegion("bottom", 0));
    EXPECT_FLOAT_EQ(session->colorBuffer()[shared * 3 + 0], 1.0f);
    EXPECT_FLOAT_EQ(session->colorBuffer()[shared * 3 + 2], 0.0f);
}

TEST_F(PaintSessionTest, SnapshotListenerSeesEveryComposite) {
    std::vector<RenderSnapshot> seen;
    session->setSnapshotListener([&seen](const RenderSnapshot& s) { seen.push_back(s); });

    loadCube();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_TRUE(seen[0].hasModel());
    ASSERT_EQ(seen[0].regions.size(), 2u);
    EXPECT_EQ(seen[0].colors->size(), 36u * 3);

    session->setVisibility("top", false);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[1].regions[0].visible);
    EXPECT_TRUE(seen[0].regions[0].visible);
    EXPECT_NE(*seen[0].colors, *seen[1].colors);

    session->setVisibility("tail", false);
    EXPECT_EQ(seen.size(), 2u);
}

TEST_F(PaintSessionTest, SnapshotSummarizesRegions) {
    loadCube();
    session->setOverrideColor("bottom", colorFromRgb24(0xFFD700));
    RenderSnapshot s = session->snapshot();
    ASSERT_EQ(s.regions.size(), 2u);
    const RegionSummary& bottom = s.regions[1];
    EXPECT_EQ(bottom.id, "bottom");
    EXPECT_TRUE(bottom.overridden);
    EXPECT_EQ(toHexColor(bottom.color), "#FFD700");
    EXPECT_EQ(bottom.vertexCount, session->paintState().regions()[1].rawIndices.size());
    EXPECT_FLOAT_EQ(bottom.percentage, 100.0f * bottom.vertexCount / 36.0f);
    EXPECT_EQ(s.selectedRegion, "top");
}

TEST_F(PaintSessionTest, LegacyPrecisionIsUsedForCanonicalTable) {
    SessionOptions opts;
    opts.quantization = QuantizationPolicy::legacy();
    session.reset(new PaintSession(oracle, opts));
    loadCube();
    EXPECT_EQ(session->model()->table.policy.digits(), 4);
    EXPECT_EQ(session->model()->stats.uniqueVertices, 8u);
}
