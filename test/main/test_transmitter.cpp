// ---------------------------------------------------------------------------
// test_transmitter.cpp: RadioTransmitter API contract tests
// ---------------------------------------------------------------------------
// Pairing, sequence numbering, payload validation, reliable send and the
// heartbeat task, all against a MockRadioDriver.  Peers that answer are
// simulated with MockRadioDriver::onTransmit injecting Ack frames.
//
// Timing notes:
//  - fastTestConfig() shrinks the pairing timeout to 400 ms and the Ack window
//    to 60 ms so the timeout paths stay short.
//  - waitForCount() polls in 5 ms increments with a 500 ms budget.
// ---------------------------------------------------------------------------

#include "unity.h"
#include "radio_transmitter.hpp"
#include "mock_radio_driver.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <memory>
#include <vector>

static const DeviceId TX_ID = 0x0000CAFE;
static const DeviceId RX_ID = 0x0000BEEF;

static bool waitForCount(volatile int& counter, int expected, uint32_t timeoutMs = 500)
{
    uint32_t deadline = xTaskGetTickCount() + pdMS_TO_TICKS(timeoutMs);
    while (xTaskGetTickCount() < deadline) {
        if (counter >= expected) return true;
        vTaskDelay(pdMS_TO_TICKS(5));
    }
    return counter >= expected;
}

// ---------------------------------------------------------------------------
// Per-test fixture: the transmitter owns the mock, the fixture keeps a handle
// ---------------------------------------------------------------------------
struct TxFixture {
    MockRadioDriver* mock;
    RadioTransmitter tx;

    explicit TxFixture(const LinkConfig& cfg = fastTestConfig())
        : mock(new MockRadioDriver),
          tx(TX_ID, std::unique_ptr<IRadioDriver>(mock), cfg)
    {
    }

    /// Answer every Pairing frame like a receiver with identity @p id.
    void ackPairingAs(DeviceId id)
    {
        mock->onTransmit = [id](const Frame& f, MockRadioDriver& m) {
            if (f.type == FrameType::Pairing) {
                m.injectFrame(makeAckFrame(id, f.sequence));
            }
        };
    }

    void pair()
    {
        ackPairingAs(RX_ID);
        TEST_ASSERT_EQUAL(ESP_OK, tx.startPairing(RX_ID));
        mock->onTransmit = nullptr;
        mock->clearLog();
    }
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

static void test_init_configures_driver(void)
{
    TxFixture f;
    TEST_ASSERT_EQUAL(ESP_OK, f.tx.init());
    TEST_ASSERT_EQUAL(1, f.mock->startClockCount);
    TEST_ASSERT_EQUAL(1, f.mock->configureCount);
    TEST_ASSERT_EQUAL_HEX32(CONFIG_NRF_LINK_DEFAULT_ADDRESS, f.mock->lastAddress);
    TEST_ASSERT_EQUAL_HEX8(CONFIG_NRF_LINK_DEFAULT_PREFIX, f.mock->lastPrefix);
    TEST_ASSERT_EQUAL(CONFIG_NRF_LINK_DEFAULT_CHANNEL, f.mock->lastChannel);
}

static void test_init_propagates_configure_error(void)
{
    TxFixture f;
    f.mock->configureResult = ESP_ERR_INVALID_ARG;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, f.tx.init());
}

static void test_set_channel_validates_range(void)
{
    TxFixture f;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, f.tx.setChannel(126));
    TEST_ASSERT_EQUAL(0, f.mock->setChannelCount);

    TEST_ASSERT_EQUAL(ESP_OK, f.tx.setChannel(125));
    TEST_ASSERT_EQUAL(1, f.mock->setChannelCount);
    TEST_ASSERT_EQUAL(125, f.mock->lastChannel);
    TEST_ASSERT_EQUAL(125, f.tx.channel());
}

// ---------------------------------------------------------------------------
// Unpaired behaviour
// ---------------------------------------------------------------------------

static void test_unpaired_sends_rejected(void)
{
    TxFixture f;
    const uint8_t data[] = {1, 2, 3};

    TEST_ASSERT_FALSE(f.tx.isPaired());
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, f.tx.sendFrame(FrameType::Data, data, sizeof(data)));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, f.tx.sendData(data, sizeof(data)));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, f.tx.sendHeartbeat());
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, f.tx.sendDataReliable(data, sizeof(data), 3));
    TEST_ASSERT_EQUAL(0, f.mock->transmitCount);
    TEST_ASSERT_EQUAL_UINT32(0, f.tx.nextSequence());
}

static void test_sequence_increments_by_one(void)
{
    TxFixture f;
    for (int i = 0; i < 4; ++i) {
        TEST_ASSERT_EQUAL(ESP_OK, f.tx.sendFrame(FrameType::Pairing, nullptr, 0));
    }

    std::vector<Frame> sent = f.mock->sentFrames();
    TEST_ASSERT_EQUAL(4u, sent.size());
    for (size_t i = 0; i < sent.size(); ++i) {
        TEST_ASSERT_EQUAL_UINT32(i, sent[i].sequence);
        TEST_ASSERT_EQUAL_HEX32(TX_ID, sent[i].senderId);
    }
    TEST_ASSERT_EQUAL_UINT32(4, f.tx.nextSequence());
}

// ---------------------------------------------------------------------------
// Pairing
// ---------------------------------------------------------------------------

static void test_pairing_request_payload(void)
{
    TxFixture f;
    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.tx.startPairing(RX_ID));
    TEST_ASSERT_FALSE(f.tx.isPaired());

    std::vector<Frame> sent = f.mock->sentFrames();
    TEST_ASSERT_EQUAL(1u, sent.size());
    TEST_ASSERT_EQUAL(static_cast<int>(FrameType::Pairing), static_cast<int>(sent[0].type));
    TEST_ASSERT_EQUAL(8u, sent[0].payload.size());
    TEST_ASSERT_EQUAL_HEX32(f.tx.pairingKey(), getLe32(sent[0].payload.data()));
    TEST_ASSERT_EQUAL_HEX32(RX_ID, getLe32(sent[0].payload.data() + 4));
}

static void test_pairing_succeeds_on_matching_ack(void)
{
    TxFixture f;
    f.ackPairingAs(RX_ID);

    TEST_ASSERT_EQUAL(ESP_OK, f.tx.startPairing(RX_ID));
    TEST_ASSERT_TRUE(f.tx.isPaired());
    TEST_ASSERT_EQUAL_HEX32(RX_ID, f.tx.pairedReceiver());
    TEST_ASSERT_TRUE(f.tx.device().paired);
    TEST_ASSERT_EQUAL_HEX32(f.tx.pairingKey(), f.tx.device().pairingKey);
}

static void test_pairing_ignores_ack_from_other_receiver(void)
{
    TxFixture f;
    f.ackPairingAs(0x00009999);

    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.tx.startPairing(RX_ID));
    TEST_ASSERT_FALSE(f.tx.isPaired());
}

static void test_pairing_ignores_ack_with_other_sequence(void)
{
    TxFixture f;
    f.mock->onTransmit = [](const Frame& sent, MockRadioDriver& m) {
        m.injectFrame(makeAckFrame(RX_ID, sent.sequence + 1));
    };

    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.tx.startPairing(RX_ID));
    TEST_ASSERT_FALSE(f.tx.isPaired());
}

static void test_pairing_skips_garbage_before_ack(void)
{
    TxFixture f;
    f.mock->onTransmit = [](const Frame& sent, MockRadioDriver& m) {
        const uint8_t junk[20] = {19, 0xFF, 0xFF};
        m.injectRaw(junk, sizeof(junk));
        m.injectFrame(makeAckFrame(RX_ID, sent.sequence));
    };

    TEST_ASSERT_EQUAL(ESP_OK, f.tx.startPairing(RX_ID));
    TEST_ASSERT_TRUE(f.tx.isPaired());
}

static void test_pairing_transmit_error_returned(void)
{
    TxFixture f;
    f.mock->transmitResult = ESP_FAIL;
    TEST_ASSERT_EQUAL(ESP_FAIL, f.tx.startPairing(RX_ID));
    TEST_ASSERT_FALSE(f.tx.isPaired());
}

// ---------------------------------------------------------------------------
// Data path
// ---------------------------------------------------------------------------

static void test_send_data_frame_content(void)
{
    TxFixture f;
    f.pair();

    const uint8_t data[] = {9, 8, 7};
    TEST_ASSERT_EQUAL(ESP_OK, f.tx.sendData(data, sizeof(data)));

    std::vector<Frame> sent = f.mock->sentFrames();
    TEST_ASSERT_EQUAL(1u, sent.size());
    TEST_ASSERT_EQUAL(static_cast<int>(FrameType::Data), static_cast<int>(sent[0].type));
    TEST_ASSERT_EQUAL_HEX32(TX_ID, sent[0].senderId);
    TEST_ASSERT_EQUAL(3u, sent[0].payload.size());
    TEST_ASSERT_EQUAL_UINT8_ARRAY(data, sent[0].payload.data(), 3);
}

static void test_payload_size_limit(void)
{
    TxFixture f;
    f.pair();

    std::vector<uint8_t> big(NRF_MAX_PAYLOAD + 1, 0x42);
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, f.tx.sendData(big.data(), big.size()));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, f.tx.sendDataReliable(big.data(), big.size(), 3));
    TEST_ASSERT_EQUAL(0, f.mock->transmitCount);

    TEST_ASSERT_EQUAL(ESP_OK, f.tx.sendData(big.data(), NRF_MAX_PAYLOAD));
    TEST_ASSERT_EQUAL(1, f.mock->transmitCount);
}

static void test_send_heartbeat_empty_payload(void)
{
    TxFixture f;
    f.pair();

    TEST_ASSERT_EQUAL(ESP_OK, f.tx.sendHeartbeat());
    std::vector<Frame> sent = f.mock->sentFrames();
    TEST_ASSERT_EQUAL(1u, sent.size());
    TEST_ASSERT_EQUAL(static_cast<int>(FrameType::Heartbeat), static_cast<int>(sent[0].type));
    TEST_ASSERT_TRUE(sent[0].payload.empty());
}

// ---------------------------------------------------------------------------
// Reliable send
// ---------------------------------------------------------------------------

static void test_reliable_silent_peer_times_out_after_max_retries(void)
{
    TxFixture f;
    f.pair();

    const uint8_t data[] = {1, 2, 3, 4};
    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.tx.sendDataReliable(data, sizeof(data), 3));
    TEST_ASSERT_EQUAL(3, f.mock->transmitCount);

    // Every retry reuses the same sequence number
    std::vector<Frame> sent = f.mock->sentFrames();
    TEST_ASSERT_EQUAL(3u, sent.size());
    TEST_ASSERT_EQUAL_UINT32(sent[0].sequence, sent[1].sequence);
    TEST_ASSERT_EQUAL_UINT32(sent[0].sequence, sent[2].sequence);
}

static void test_reliable_ack_on_second_attempt(void)
{
    TxFixture f;
    f.pair();

    int dataFrames = 0;
    f.mock->onTransmit = [&dataFrames](const Frame& sent, MockRadioDriver& m) {
        if (sent.type == FrameType::Data && ++dataFrames == 2) {
            m.injectFrame(makeAckFrame(RX_ID, sent.sequence));
        }
    };

    const uint8_t data[] = {0xAB};
    TEST_ASSERT_EQUAL(ESP_OK, f.tx.sendDataReliable(data, sizeof(data), 3));
    TEST_ASSERT_EQUAL(2, f.mock->transmitCount);
}

static void test_reliable_ignores_ack_for_other_sequence(void)
{
    TxFixture f;
    f.pair();

    f.mock->onTransmit = [](const Frame& sent, MockRadioDriver& m) {
        m.injectFrame(makeAckFrame(RX_ID, sent.sequence + 100));
    };

    const uint8_t data[] = {0x01};
    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.tx.sendDataReliable(data, sizeof(data), 2));
    TEST_ASSERT_EQUAL(2, f.mock->transmitCount);
}

static void test_reliable_zero_retries_sends_nothing(void)
{
    TxFixture f;
    f.pair();

    const uint8_t data[] = {0x01};
    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.tx.sendDataReliable(data, sizeof(data), 0));
    TEST_ASSERT_EQUAL(0, f.mock->transmitCount);
}

static void test_reliable_transmit_error_aborts(void)
{
    TxFixture f;
    f.pair();
    f.mock->transmitResult = ESP_FAIL;

    const uint8_t data[] = {0x01};
    TEST_ASSERT_EQUAL(ESP_FAIL, f.tx.sendDataReliable(data, sizeof(data), 3));
    TEST_ASSERT_EQUAL(1, f.mock->transmitCount);
}

// ---------------------------------------------------------------------------
// Heartbeat task
// ---------------------------------------------------------------------------

static void test_heartbeat_task_sends_periodically(void)
{
    TxFixture f;
    f.pair();

    TEST_ASSERT_EQUAL(ESP_OK, f.tx.startHeartbeatTask());
    TEST_ASSERT_TRUE(waitForCount(f.mock->transmitCount, 2));
    f.tx.stopHeartbeatTask();

    for (const Frame& fr : f.mock->sentFrames()) {
        TEST_ASSERT_EQUAL(static_cast<int>(FrameType::Heartbeat), static_cast<int>(fr.type));
    }

    // Nothing more after stop
    const int count = f.mock->transmitCount;
    vTaskDelay(pdMS_TO_TICKS(150));
    TEST_ASSERT_EQUAL(count, f.mock->transmitCount);
}

static void test_heartbeat_task_unpaired_sends_nothing(void)
{
    TxFixture f;
    TEST_ASSERT_EQUAL(ESP_OK, f.tx.startHeartbeatTask());
    vTaskDelay(pdMS_TO_TICKS(150));
    f.tx.stopHeartbeatTask();
    TEST_ASSERT_EQUAL(0, f.mock->transmitCount);
}

static void test_heartbeat_task_start_is_idempotent(void)
{
    TxFixture f;
    f.pair();
    TEST_ASSERT_EQUAL(ESP_OK, f.tx.startHeartbeatTask());
    TEST_ASSERT_EQUAL(ESP_OK, f.tx.startHeartbeatTask());
    TEST_ASSERT_TRUE(waitForCount(f.mock->transmitCount, 1));
    // Destructor stops the task
}

// ---------------------------------------------------------------------------
// Suite entry point
// ---------------------------------------------------------------------------

void run_test_transmitter(void)
{
    RUN_TEST(test_init_configures_driver);
    RUN_TEST(test_init_propagates_configure_error);
    RUN_TEST(test_set_channel_validates_range);
    RUN_TEST(test_unpaired_sends_rejected);
    RUN_TEST(test_sequence_increments_by_one);
    RUN_TEST(test_pairing_request_payload);
    RUN_TEST(test_pairing_succeeds_on_matching_ack);
    RUN_TEST(test_pairing_ignores_ack_from_other_receiver);
    RUN_TEST(test_pairing_ignores_ack_with_other_sequence);
    RUN_TEST(test_pairing_skips_garbage_before_ack);
    RUN_TEST(test_pairing_transmit_error_returned);
    RUN_TEST(test_send_data_frame_content);
    RUN_TEST(test_payload_size_limit);
    RUN_TEST(test_send_heartbeat_empty_payload);
    RUN_TEST(test_reliable_silent_peer_times_out_after_max_retries);
    RUN_TEST(test_reliable_ack_on_second_attempt);
    RUN_TEST(test_reliable_ignores_ack_for_other_sequence);
    RUN_TEST(test_reliable_zero_retries_sends_nothing);
    RUN_TEST(test_reliable_transmit_error_aborts);
    RUN_TEST(test_heartbeat_task_sends_periodically);
    RUN_TEST(test_heartbeat_task_unpaired_sends_nothing);
    RUN_TEST(test_heartbeat_task_start_is_idempotent);
}
