#include <gtest/gtest.h>

#include <vector>

#include "beacon_tracker.h"
#include "fakes.h"

namespace zonewatch {
namespace {

using test::FakeRadio;
using test::ManualClock;
using test::ManualTicker;
using test::RecordingBeaconListener;
using test::iBeaconFrame;
using test::identity;
using test::kOtherUuid;
using test::kTestUuid;

class BeaconTrackerTest : public ::testing::Test {
 protected:
  BeaconTrackerTest() : tracker(radio, ticker, clock) {
    tracker.addListener(&listener);
  }

  void see(const char* uuid, uint16_t major, uint16_t minor, int rssi, uint32_t ts) {
    radio.deliver(iBeaconFrame(uuid, major, minor), rssi, ts);
  }

  size_t beaconCount() const {
    BeaconSnapshot snap;
    tracker.snapshot(&snap);
    return snap.count;
  }

  FakeRadio radio;
  ManualTicker ticker;
  ManualClock clock;
  RecordingBeaconListener listener;
  BeaconTracker tracker;
};

TEST_F(BeaconTrackerTest, StartRunsRadioAndExpiryTicker) {
  EXPECT_FALSE(tracker.isRunning());
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  EXPECT_TRUE(tracker.isRunning());
  EXPECT_TRUE(radio.scanning);
  EXPECT_TRUE(ticker.running);
  EXPECT_EQ(kDefaultExpiryIntervalMs, ticker.periodMs);
}

TEST_F(BeaconTrackerTest, StartWhileRunningIsNoop) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  EXPECT_EQ(ScanStatus::kOk, tracker.start());
  EXPECT_EQ(1, radio.startCalls);
}

TEST_F(BeaconTrackerTest, RadioFailureLeavesTrackerStopped) {
  radio.failWith = ScanStatus::kPermissionDenied;
  EXPECT_EQ(ScanStatus::kPermissionDenied, tracker.start());
  EXPECT_FALSE(tracker.isRunning());
  EXPECT_FALSE(ticker.running);

  // A later attempt can still succeed.
  radio.failWith = ScanStatus::kOk;
  EXPECT_EQ(ScanStatus::kOk, tracker.start());
  EXPECT_TRUE(tracker.isRunning());
}

TEST_F(BeaconTrackerTest, TickerFailureRollsBackRadio) {
  ticker.startResult = false;
  EXPECT_EQ(ScanStatus::kTaskFailed, tracker.start());
  EXPECT_FALSE(tracker.isRunning());
  EXPECT_FALSE(radio.scanning);
  EXPECT_GE(radio.stopCalls, 1);

  see(kTestUuid, 1, 1, -70, 0);
  EXPECT_EQ(0u, beaconCount());
  EXPECT_TRUE(listener.discovered.empty());
}

TEST_F(BeaconTrackerTest, StatusNames) {
  EXPECT_STREQ("OK", scanStatusName(ScanStatus::kOk));
  EXPECT_STREQ("PERMISSION_DENIED", scanStatusName(ScanStatus::kPermissionDenied));
  EXPECT_STREQ("RADIO_UNAVAILABLE", scanStatusName(ScanStatus::kRadioUnavailable));
}

TEST_F(BeaconTrackerTest, FirstDiscoveryNotifiedOnce) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  for (uint32_t t = 0; t < 5; t++) see(kTestUuid, 1, 100, -70, t * 100);

  ASSERT_EQ(1u, listener.discovered.size());
  EXPECT_EQ(identity(kTestUuid, 1, 100), listener.discovered[0].id);
  EXPECT_EQ(0u, listener.discovered[0].firstSeenMs);

  BeaconSnapshot snap;
  tracker.snapshot(&snap);
  ASSERT_EQ(1u, snap.count);
  EXPECT_EQ(5u, snap.beacons[0].sightings);
  EXPECT_EQ(400u, snap.beacons[0].lastSeenMs);
  EXPECT_EQ(0u, snap.beacons[0].firstSeenMs);
}

TEST_F(BeaconTrackerTest, EachIdentityTrackedSeparately) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 100, -70, 0);
  see(kTestUuid, 1, 101, -70, 0);
  see(kOtherUuid, 1, 100, -70, 0);
  see(kTestUuid, 1, 100, -72, 10);

  EXPECT_EQ(3u, listener.discovered.size());
  EXPECT_EQ(3u, beaconCount());
}

TEST_F(BeaconTrackerTest, SnapshotCarriesSmoothedDistance) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  for (uint32_t t = 0; t < 10; t++) see(kTestUuid, 1, 1, -70, t);

  BeaconSnapshot snap;
  clock.set(77);
  tracker.snapshot(&snap);
  ASSERT_EQ(1u, snap.count);
  EXPECT_NEAR(3.4724, snap.beacons[0].distanceM, 1e-3);
  EXPECT_EQ(-70, snap.beacons[0].rssi);
  EXPECT_EQ(-59, snap.beacons[0].txPower);
  EXPECT_EQ(77u, snap.takenAtMs);
}

TEST_F(BeaconTrackerTest, FarFirstFrameDoesNotHoldDistanceHigh) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -100, 0);  // 52.7 m, beyond the outlier gate

  BeaconSnapshot snap;
  tracker.snapshot(&snap);
  ASSERT_EQ(1u, snap.count);
  EXPECT_DOUBLE_EQ(kDefaultMaxDistanceM, snap.beacons[0].distanceM);

  see(kTestUuid, 1, 1, -70, 1000);
  tracker.snapshot(&snap);
  ASSERT_EQ(1u, snap.count);
  EXPECT_NEAR(3.4724, snap.beacons[0].distanceM, 1e-3);
}

TEST_F(BeaconTrackerTest, NoNotificationAfterStop) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -70, 0);
  tracker.stop();
  EXPECT_FALSE(tracker.isRunning());
  EXPECT_FALSE(radio.scanning);
  EXPECT_FALSE(ticker.running);

  const TrackerStats before = tracker.stats();
  see(kTestUuid, 1, 2, -70, 10);
  see(kTestUuid, 1, 1, -70, 10);

  EXPECT_EQ(1u, listener.discovered.size());
  EXPECT_EQ(before.framesReceived, tracker.stats().framesReceived);

  // Stop keeps what was already tracked.
  EXPECT_EQ(1u, beaconCount());
}

TEST_F(BeaconTrackerTest, MalformedFramesAreCountedAndDropped) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  std::vector<uint8_t> frame = iBeaconFrame(kTestUuid, 1, 1);
  frame.pop_back();
  radio.deliver(frame, -70, 0);
  radio.deliver(iBeaconFrame(kTestUuid, 1, 1), 0, 0);

  const TrackerStats s = tracker.stats();
  EXPECT_EQ(2u, s.framesReceived);
  EXPECT_EQ(2u, s.framesRejected);
  EXPECT_EQ(0u, s.beaconFrames);
  EXPECT_EQ(0u, beaconCount());
  EXPECT_TRUE(listener.discovered.empty());
}

TEST_F(BeaconTrackerTest, ExpiresAfterTimeout) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -70, 1000);
  see(kTestUuid, 1, 2, -70, 30000);

  EXPECT_EQ(0u, tracker.expireStale(1000 + kDefaultBeaconTimeoutMs));
  EXPECT_EQ(2u, beaconCount());

  EXPECT_EQ(1u, tracker.expireStale(1001 + kDefaultBeaconTimeoutMs));
  ASSERT_EQ(1u, listener.lost.size());
  EXPECT_EQ(identity(kTestUuid, 1, 1), listener.lost[0].id);
  EXPECT_EQ(1u, beaconCount());
  EXPECT_EQ(1u, tracker.stats().expired);
}

TEST_F(BeaconTrackerTest, ExpiryTickerUsesClock) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -70, 0);

  clock.set(5000);
  ticker.fire();
  EXPECT_EQ(1u, beaconCount());

  clock.set(kDefaultBeaconTimeoutMs + 5000);
  ticker.fire();
  EXPECT_EQ(0u, beaconCount());
}

TEST_F(BeaconTrackerTest, TimestampAheadOfClockIsNotExpired) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -70, 10050);
  EXPECT_EQ(0u, tracker.expireStale(10000));
  EXPECT_EQ(1u, beaconCount());
}

TEST_F(BeaconTrackerTest, RediscoveredAfterExpiry) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -90, 0);
  tracker.expireStale(kDefaultBeaconTimeoutMs + 1);
  see(kTestUuid, 1, 1, -70, kDefaultBeaconTimeoutMs + 2);

  ASSERT_EQ(2u, listener.discovered.size());
  // Fresh filter, no memory of the old -90 readings.
  EXPECT_NEAR(3.4724, listener.discovered[1].distanceM, 1e-3);
  EXPECT_EQ(1u, listener.discovered[1].sightings);
}

TEST_F(BeaconTrackerTest, UuidFilterDropsOthers) {
  BeaconUuid allowed;
  ASSERT_TRUE(parseUuid(kTestUuid, &allowed));
  ASSERT_TRUE(tracker.setUuidFilter(&allowed, 1));
  ASSERT_EQ(ScanStatus::kOk, tracker.start());

  see(kOtherUuid, 1, 1, -70, 0);
  see(kTestUuid, 1, 1, -70, 0);

  EXPECT_EQ(1u, beaconCount());
  EXPECT_EQ(1u, tracker.stats().framesFiltered);
  ASSERT_EQ(1u, listener.discovered.size());
  EXPECT_EQ(allowed, listener.discovered[0].id.uuid);

  ASSERT_TRUE(tracker.setUuidFilter(nullptr, 0));
  see(kOtherUuid, 1, 1, -70, 10);
  EXPECT_EQ(2u, beaconCount());
}

TEST_F(BeaconTrackerTest, UuidFilterIsBounded) {
  BeaconUuid many[kMaxUuidFilter + 1];
  EXPECT_FALSE(tracker.setUuidFilter(many, kMaxUuidFilter + 1));
  EXPECT_TRUE(tracker.setUuidFilter(many, kMaxUuidFilter));
}

TEST_F(BeaconTrackerTest, FullTableDropsNewIdentities) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  for (uint16_t minor = 0; minor < kMaxTrackedBeacons; minor++) {
    see(kTestUuid, 1, minor, -70, 0);
  }
  see(kTestUuid, 2, 0, -70, 0);
  see(kTestUuid, 2, 1, -70, 0);
  // Known identities still refresh.
  see(kTestUuid, 1, 0, -70, 100);

  EXPECT_EQ(kMaxTrackedBeacons, beaconCount());
  EXPECT_EQ(kMaxTrackedBeacons, listener.discovered.size());
  EXPECT_EQ(2u, tracker.stats().tableFullDrops);

  BeaconSnapshot snap;
  tracker.snapshot(&snap);
  bool refreshed = false;
  for (size_t i = 0; i < snap.count; i++) {
    if (snap.beacons[i].id == identity(kTestUuid, 1, 0)) refreshed = snap.beacons[i].lastSeenMs == 100;
  }
  EXPECT_TRUE(refreshed);
}

TEST_F(BeaconTrackerTest, ClearForgetsEverything) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -70, 0);
  tracker.clear();
  EXPECT_EQ(0u, beaconCount());

  see(kTestUuid, 1, 1, -70, 10);
  EXPECT_EQ(2u, listener.discovered.size());
}

TEST_F(BeaconTrackerTest, RemovedListenerIsNotCalled) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  tracker.removeListener(&listener);
  see(kTestUuid, 1, 1, -70, 0);
  EXPECT_TRUE(listener.discovered.empty());
}

TEST_F(BeaconTrackerTest, ListenerSlotsAreBounded) {
  RecordingBeaconListener extra[kMaxBeaconListeners];
  // The fixture listener already holds one slot.
  for (size_t i = 0; i + 1 < kMaxBeaconListeners; i++) EXPECT_TRUE(tracker.addListener(&extra[i]));
  EXPECT_FALSE(tracker.addListener(&extra[kMaxBeaconListeners - 1]));
  // Adding twice is not an error and takes no slot.
  EXPECT_TRUE(tracker.addListener(&listener));
}

TEST_F(BeaconTrackerTest, StatsCountEveryStage) {
  ASSERT_EQ(ScanStatus::kOk, tracker.start());
  see(kTestUuid, 1, 1, -70, 0);
  see(kTestUuid, 1, 1, -71, 1);
  radio.deliver(std::vector<uint8_t>(3, 0x00), -70, 2);

  const TrackerStats s = tracker.stats();
  EXPECT_EQ(3u, s.framesReceived);
  EXPECT_EQ(2u, s.beaconFrames);
  EXPECT_EQ(1u, s.framesRejected);
  EXPECT_EQ(1u, s.discovered);
}

}  // namespace
}  // namespace zonewatch
