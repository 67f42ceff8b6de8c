/**
 * test_weighing_engine.cpp - End-to-end pipeline tests
 *
 * Samples are submitted directly with synthetic clocks, one sample period
 * (31.25 ms) apart, so frame closes and liveness decisions are deterministic.
 */

#include <unity.h>
#include <stdint.h>
#include <string.h>

#include "WeighLog.h"
#include "WeighingEngine.h"

static const uint32_t NODE_IDS[4] = {11111, 22222, 67890, 12345};
static const uint64_t PERIOD_US = 31250;

static const float EMPTY_KG[4] = {150.50f, 148.20f, 151.80f, 149.50f};
static const float LOADED_KG[4] = {163.06f, 161.72f, 162.45f, 162.08f};

static WeighingEngine *engine = nullptr;
static uint64_t clockUs = 0;
static uint32_t outputCount = 0;
static WeighingOutput lastSeen;

static WeighingConfig makeConfig(void)
{
    WeighingConfig cfg;
    cfg.addNode(NODE_IDS[0], "celda_sup_izq");
    cfg.addNode(NODE_IDS[1], "celda_sup_der");
    cfg.addNode(NODE_IDS[2], "celda_inf_izq");
    cfg.addNode(NODE_IDS[3], "celda_inf_der");
    return cfg;
}

static RawSample makeSample(uint32_t nodeId, uint64_t tsUs, float kg)
{
    RawSample s;
    s.nodeId = nodeId;
    s.timestampUs = tsUs;
    s.valueKg = kg;
    return s;
}

// One sample period: every node in mask reports kg[i] at the same instant
static void feedFrame(const float *kg, NodeMask mask)
{
    for (uint8_t i = 0; i < 4; i++)
    {
        if (maskHas(mask, i))
        {
            engine->submit(makeSample(NODE_IDS[i], clockUs, kg[i]), clockUs);
        }
    }
    clockUs += PERIOD_US;
}

static void feedFrames(const float *kg, NodeMask mask, int count)
{
    for (int f = 0; f < count; f++)
    {
        feedFrame(kg, mask);
    }
}

void setUp(void)
{
    suppressSerialLogs = true;
    clockUs = 1000000;
    outputCount = 0;
    memset(&lastSeen, 0, sizeof(lastSeen));

    engine = new WeighingEngine();
    TEST_ASSERT_TRUE(engine->init(makeConfig()));
    engine->setOutputCallback([](const WeighingOutput &out) {
        outputCount++;
        lastSeen = out;
    });
}

void tearDown(void)
{
    delete engine;
    engine = nullptr;
}

/**
 * TEST: Empty platform tared, then loaded: nets and total match the load
 */
void test_tare_then_load(void)
{
    feedFrames(EMPTY_KG, 0x0F, 20);
    TEST_ASSERT_EQUAL_UINT8(4, engine->captureTare());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 150.50f, engine->getTare(0));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 149.50f, engine->getTare(3));

    feedFrames(LOADED_KG, 0x0F, 40);

    TEST_ASSERT_TRUE(lastSeen.complete);
    TEST_ASSERT_EQUAL_INT(FRAME_CLOSE_COMPLETE, lastSeen.closeReason);
    TEST_ASSERT_EQUAL_HEX8(0x0F, lastSeen.contributing);
    TEST_ASSERT_EQUAL_HEX8(0x00, lastSeen.staleNodes);

    TEST_ASSERT_FLOAT_WITHIN(0.01f, 12.56f, lastSeen.nodes[0].netKg);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 13.52f, lastSeen.nodes[1].netKg);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 10.65f, lastSeen.nodes[2].netKg);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 12.58f, lastSeen.nodes[3].netKg);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 49.31f, lastSeen.totalNetKg);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 600.0f, lastSeen.totalTareKg);

    TEST_ASSERT_EQUAL_STRING("celda_inf_izq", lastSeen.nodes[2].name);
    TEST_ASSERT_EQUAL_UINT32(67890, lastSeen.nodes[2].nodeId);
}

/**
 * TEST: One output per closed frame, mirrored by getLastOutput()
 */
void test_one_output_per_frame(void)
{
    feedFrames(LOADED_KG, 0x0F, 10);
    TEST_ASSERT_EQUAL_UINT32(10, outputCount);

    WeighingOutput last;
    TEST_ASSERT_TRUE(engine->getLastOutput(last));
    TEST_ASSERT_EQUAL_UINT32(lastSeen.frameNumber, last.frameNumber);

    EngineStatistics s = engine->getStatistics();
    TEST_ASSERT_EQUAL_UINT32(40, s.samplesSubmitted);
    TEST_ASSERT_EQUAL_UINT32(40, s.samplesAccepted);
    TEST_ASSERT_EQUAL_UINT32(10, s.framesEmitted);
    TEST_ASSERT_EQUAL_UINT32(10, s.framesComplete);
    TEST_ASSERT_EQUAL_UINT8(4, s.onlineNodes);
    TEST_ASSERT_EQUAL_UINT8(4, s.linkOnlineNodes);
}

/**
 * TEST: A missing node in one frame reuses its smoothed value
 */
void test_incomplete_frame_reuses_last_value(void)
{
    feedFrames(LOADED_KG, 0x0F, 10);
    uint32_t before = outputCount;

    feedFrame(LOADED_KG, 0x0B); // node 2 misses this period
    feedFrame(LOADED_KG, 0x01); // closes it by tolerance

    TEST_ASSERT_EQUAL_UINT32(before + 1, outputCount);
    TEST_ASSERT_FALSE(lastSeen.complete);
    TEST_ASSERT_EQUAL_INT(FRAME_CLOSE_TOLERANCE, lastSeen.closeReason);
    TEST_ASSERT_FALSE(lastSeen.nodes[2].present);
    TEST_ASSERT_TRUE(lastSeen.nodes[2].hasValue);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 162.45f, lastSeen.nodes[2].filteredKg);

    // Still ONLINE at the processing layer, so it still counts
    TEST_ASSERT_EQUAL_INT(NODE_ONLINE, lastSeen.nodes[2].status);
    TEST_ASSERT_EQUAL_HEX8(0x0F, lastSeen.contributing);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 649.31f, lastSeen.totalNetKg);
}

/**
 * TEST: A silent node goes STALE, leaves the total, keeps its tare across
 * a capture, and counts again when it comes back
 */
void test_stale_node_excluded_and_tare_isolated(void)
{
    feedFrames(EMPTY_KG, 0x0F, 10);
    TEST_ASSERT_EQUAL_UINT8(4, engine->captureTare());

    // Node 2 (67890) silent for more than 3 s
    feedFrames(LOADED_KG, 0x0B, 110);

    TEST_ASSERT_EQUAL_HEX8(0x04, lastSeen.staleNodes);
    TEST_ASSERT_EQUAL_HEX8(0x0B, lastSeen.contributing);
    TEST_ASSERT_EQUAL_INT(NODE_STALE, lastSeen.nodes[2].status);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 12.56f + 13.52f + 12.58f,
                             lastSeen.totalNetKg);

    bool sawStale = false;
    NodeHealthEvent ev;
    while (engine->popHealthEvent(ev))
    {
        if (ev.nodeId == 67890 && ev.to == NODE_STALE)
        {
            sawStale = true;
        }
    }
    TEST_ASSERT_TRUE(sawStale);

    // Tare while node 2 is offline: its previous tare is kept
    TEST_ASSERT_EQUAL_UINT8(3, engine->captureTare());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 151.80f, engine->getTare(2));
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 163.06f, engine->getTare(0));

    // Node 2 returns with the platform still loaded. Its filters still hold
    // the empty reading and need a few periods to settle.
    feedFrames(LOADED_KG, 0x0F, 40);

    TEST_ASSERT_EQUAL_INT(NODE_ONLINE, lastSeen.nodes[2].status);
    TEST_ASSERT_EQUAL_HEX8(0x0F, lastSeen.contributing);
    TEST_ASSERT_EQUAL_HEX8(0x00, lastSeen.staleNodes);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 10.65f, lastSeen.nodes[2].netKg);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 10.65f, lastSeen.totalNetKg);
}

/**
 * TEST: A STALE node whose first sample closes the open window is still
 * STALE in the frame it closes; it counts again from its own frame on
 */
void test_returning_node_does_not_join_previous_frame(void)
{
    const float kg[4] = {10.0f, 20.0f, 1000.0f, 40.0f};
    feedFrames(kg, 0x0F, 10);

    // Node 2 silent for more than 3 s; the last partial window stays open
    feedFrames(kg, 0x0B, 110);
    TEST_ASSERT_EQUAL_HEX8(0x04, lastSeen.staleNodes);
    uint32_t before = outputCount;

    // Node 2 reports first in the new window and closes the open one
    engine->submit(makeSample(NODE_IDS[2], clockUs, 500.0f), clockUs);

    TEST_ASSERT_EQUAL_UINT32(before + 1, outputCount);
    TEST_ASSERT_EQUAL_INT(FRAME_CLOSE_TOLERANCE, lastSeen.closeReason);
    TEST_ASSERT_FALSE(lastSeen.nodes[2].present);
    TEST_ASSERT_EQUAL_INT(NODE_STALE, lastSeen.nodes[2].status);
    TEST_ASSERT_EQUAL_HEX8(0x04, lastSeen.staleNodes);
    TEST_ASSERT_EQUAL_HEX8(0x0B, lastSeen.contributing);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 70.0f, lastSeen.totalNetKg);
    // Raw value of the absent node is its last reading, not the new sample
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1000.0f, lastSeen.nodes[2].rawKg);

    // The rest of the window completes the frame node 2 opened
    engine->submit(makeSample(NODE_IDS[0], clockUs, kg[0]), clockUs);
    engine->submit(makeSample(NODE_IDS[1], clockUs, kg[1]), clockUs);
    engine->submit(makeSample(NODE_IDS[3], clockUs, kg[3]), clockUs);
    clockUs += PERIOD_US;

    TEST_ASSERT_EQUAL_UINT32(before + 2, outputCount);
    TEST_ASSERT_TRUE(lastSeen.complete);
    TEST_ASSERT_TRUE(lastSeen.nodes[2].present);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 500.0f, lastSeen.nodes[2].rawKg);
    TEST_ASSERT_EQUAL_INT(NODE_ONLINE, lastSeen.nodes[2].status);
    TEST_ASSERT_EQUAL_HEX8(0x00, lastSeen.staleNodes);
    TEST_ASSERT_EQUAL_HEX8(0x0F, lastSeen.contributing);
}

/**
 * TEST: tick() closes an open frame on timeout and sweeps liveness
 */
void test_tick_drives_timeouts(void)
{
    engine->submit(makeSample(NODE_IDS[0], clockUs, 163.0f), clockUs);
    engine->submit(makeSample(NODE_IDS[1], clockUs, 161.0f), clockUs);
    TEST_ASSERT_EQUAL_UINT32(0, outputCount);

    engine->tick(clockUs + 50001);
    TEST_ASSERT_EQUAL_UINT32(1, outputCount);
    TEST_ASSERT_EQUAL_INT(FRAME_CLOSE_TIMEOUT, lastSeen.closeReason);
    TEST_ASSERT_EQUAL_UINT8(2, (uint8_t)(lastSeen.nodes[0].present +
                                         lastSeen.nodes[1].present));
    TEST_ASSERT_FALSE(lastSeen.nodes[2].hasValue);
    TEST_ASSERT_EQUAL_HEX8(0x03, lastSeen.contributing);

    // No samples at all for 3 s: processing layer goes STALE first
    engine->tick(clockUs + 3000001);
    EngineStatistics s = engine->getStatistics();
    TEST_ASSERT_EQUAL_UINT8(0, s.onlineNodes);
    TEST_ASSERT_EQUAL_UINT8(2, s.linkOnlineNodes);

    // Then the connection layer at 5 s
    engine->tick(clockUs + 5000001);
    s = engine->getStatistics();
    TEST_ASSERT_EQUAL_UINT8(0, s.linkOnlineNodes);

    NodeHealthEvent ev;
    uint8_t linkStale = 0;
    while (engine->popLinkEvent(ev))
    {
        if (ev.to == NODE_STALE)
            linkStale++;
    }
    TEST_ASSERT_EQUAL_UINT8(2, linkStale);
}

/**
 * TEST: A single spike does not reach the smoothed value
 */
void test_spike_removed_by_median(void)
{
    feedFrames(LOADED_KG, 0x0F, 10);

    float spiked[4] = {LOADED_KG[0], LOADED_KG[1], 300.0f, LOADED_KG[3]};
    feedFrame(spiked, 0x0F);

    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 300.0f, lastSeen.nodes[2].rawKg);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 162.45f, lastSeen.nodes[2].filteredKg);
}

/**
 * TEST: Requested filter reset is applied before the next sample or tick
 */
void test_filter_reset_request(void)
{
    feedFrames(EMPTY_KG, 0x0F, 10);
    engine->captureTare();

    NodeFilterSnapshot f;
    TEST_ASSERT_TRUE(engine->getFilterState(1, f));
    TEST_ASSERT_TRUE(f.emaInitialized);
    TEST_ASSERT_EQUAL_UINT8(5, f.windowCount);

    engine->requestFilterReset();
    engine->tick(clockUs);

    TEST_ASSERT_TRUE(engine->getFilterState(1, f));
    TEST_ASSERT_FALSE(f.emaInitialized);
    TEST_ASSERT_EQUAL_UINT8(0, f.windowCount);
    TEST_ASSERT_EQUAL_UINT8(5, f.windowSize);
    TEST_ASSERT_EQUAL_UINT32(1, engine->getStatistics().filterResets);

    // Tares survive a filter reset
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 148.20f, engine->getTare(1));

    // First sample after the reset passes straight through
    feedFrame(LOADED_KG, 0x0F);
    feedFrame(LOADED_KG, 0x01);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 161.72f, lastSeen.nodes[1].filteredKg);
}

/**
 * TEST: Rejected samples change nothing downstream
 */
void test_rejected_samples_have_no_effect(void)
{
    TEST_ASSERT_EQUAL_INT(SAMPLE_UNKNOWN_NODE,
                          engine->submit(makeSample(99999, clockUs, 10.0f),
                                         clockUs));
    TEST_ASSERT_EQUAL_INT(SAMPLE_OUT_OF_RANGE,
                          engine->submit(makeSample(11111, clockUs, 99999.0f),
                                         clockUs));

    engine->tick(clockUs + 100000);

    TEST_ASSERT_EQUAL_UINT32(0, outputCount);
    WeighingOutput out;
    TEST_ASSERT_FALSE(engine->getLastOutput(out));

    NodeHealthSnapshot h;
    TEST_ASSERT_TRUE(engine->getNodeHealth(0, h));
    TEST_ASSERT_EQUAL_INT(NODE_UNSEEN, h.signalStatus);
    TEST_ASSERT_EQUAL_INT(NODE_UNSEEN, h.linkStatus);
    TEST_ASSERT_EQUAL_UINT32(1, h.outOfRange);

    EngineStatistics s = engine->getStatistics();
    TEST_ASSERT_EQUAL_UINT32(2, s.samplesSubmitted);
    TEST_ASSERT_EQUAL_UINT32(0, s.samplesAccepted);
    TEST_ASSERT_EQUAL_UINT32(1, s.unknownNode);
    TEST_ASSERT_EQUAL_UINT32(1, s.outOfRange);

    // Nothing to tare yet
    TEST_ASSERT_EQUAL_UINT8(0, engine->captureTare());
}

/**
 * TEST: shutdown() discards the in-flight frame
 */
void test_shutdown_discards_open_frame(void)
{
    feedFrames(LOADED_KG, 0x0F, 3);
    engine->submit(makeSample(NODE_IDS[0], clockUs, 163.0f), clockUs);

    engine->shutdown();
    engine->tick(clockUs + 1000000);

    TEST_ASSERT_EQUAL_UINT32(3, outputCount);
}

/**
 * TEST: An invalid configuration is rejected and the engine stays inert
 */
void test_invalid_config_rejected(void)
{
    WeighingEngine bad;
    WeighingConfig cfg = makeConfig();
    cfg.medianWindow = 4;

    TEST_ASSERT_FALSE(bad.init(cfg));
    TEST_ASSERT_FALSE(bad.isInitialized());
    TEST_ASSERT_EQUAL_INT(CONFIG_EVEN_WINDOW, bad.getConfigError());
    TEST_ASSERT_EQUAL_INT(SAMPLE_UNKNOWN_NODE,
                          bad.submit(makeSample(11111, 1, 1.0f), 1));
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char **argv)
{
    UNITY_BEGIN();

    RUN_TEST(test_tare_then_load);
    RUN_TEST(test_one_output_per_frame);
    RUN_TEST(test_incomplete_frame_reuses_last_value);
    RUN_TEST(test_stale_node_excluded_and_tare_isolated);
    RUN_TEST(test_returning_node_does_not_join_previous_frame);
    RUN_TEST(test_tick_drives_timeouts);
    RUN_TEST(test_spike_removed_by_median);
    RUN_TEST(test_filter_reset_request);
    RUN_TEST(test_rejected_samples_have_no_effect);
    RUN_TEST(test_shutdown_discards_open_frame);
    RUN_TEST(test_invalid_config_rejected);

    return UNITY_END();
}
