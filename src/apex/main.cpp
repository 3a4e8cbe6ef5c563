// Copyright 2025 <Apex Telemetry>
// Apex ride recorder host

#include <stdio.h>
#include <string.h>

#include <fstream>
#include <iostream>
#include <string>

#include "apex/clock.h"
#include "apex/command_protocol.h"
#include "apex/debug_log.h"
#include "apex/notification.h"
#include "apex/recorder.h"
#include "apex/ride_config.h"
#include "apex/ride_log_storage.h"
#include "apex/sensors.h"
#include "apex/session_store.h"
#include "apex/settings.h"
#include "version.h"

static void printUsage(const char* name) {
  fprintf(stderr,
          "apex_recorder " APEX_VERSION_STRING "\n"
          "Usage: %s [--settings PATH] [--replay FILE] [--manual-clock]\n"
          "  Reads one JSON command per line from FILE (or stdin) and answers on stdout.\n"
          "  --manual-clock  take time only from the \"t\" field of each command\n"
          "                  (implied by --replay)\n",
          name);
}

int main(int argc, char** argv) {
  std::string settingsPath = DEFAULT_SETTINGS_PATH;
  std::string replayPath;
  bool manualClock = false;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
      settingsPath = argv[++i];
    } else if (strcmp(argv[i], "--replay") == 0 && i + 1 < argc) {
      replayPath = argv[++i];
      manualClock = true;
    } else if (strcmp(argv[i], "--manual-clock") == 0) {
      manualClock = true;
    } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  SettingsStore settings(settingsPath);
  settings.refresh();
  setLogLevel(logLevelFromString(settings.data().logLevel.c_str(), LogLevel::INFO));
  apexLog(LogLevel::INFO, "Main", "apex_recorder %s, settings %s", APEX_VERSION_STRING,
          settingsPath.c_str());

  std::ifstream replayFile;
  if (!replayPath.empty()) {
    replayFile.open(replayPath);
    if (!replayFile.is_open()) {
      apexLog(LogLevel::ERROR, "Main", "Cannot open replay file %s", replayPath.c_str());
      return 1;
    }
  }
  std::istream& input = replayPath.empty() ? std::cin : replayFile;

  ManualClock replayClock;
  SystemClock wallClock;
  const IClock& clock = manualClock ? static_cast<const IClock&>(replayClock) : wallClock;

  // Notices go to the log and to the queue reported with each answer
  ConsoleNotifier consoleNotifier;
  NotificationQueue noticeQueue;
  MultiNotifier notifier;
  notifier.addSink(&consoleNotifier);
  notifier.addSink(&noticeQueue);

  SessionStore store;
  FeedPositionSource position;
  AccelerometerSource accelerometer;
  DeviceMotionSource deviceMotion;
  FeedProximitySource proximity;
  JsonlRideStorage storage(settings.data().rideLogPath, settings.data().userId,
                           settings.data().geometrySupported);

  RecorderContext ctx{
    .store = store,
    .position = position,
    .accelerometer = &accelerometer,
    .deviceMotion = &deviceMotion,
    .proximity = &proximity,
    .storage = storage,
    .calibration = &settings,
    .clock = clock,
    .notifier = &notifier,
    .orientationPreference = settings.data().orientationSource,
  };
  RideRecorder recorder(ctx);

  CommandProcessor processor(CommandTargets{
    .recorder = recorder,
    .position = position,
    .accelerometer = accelerometer,
    .deviceMotion = deviceMotion,
    .proximity = proximity,
    .replayClock = manualClock ? &replayClock : nullptr,
    .notices = &noticeQueue,
    .defaultBikeId = settings.data().bikeId,
  });

  std::string line;
  std::string response;
  unsigned long rejected = 0;
  while (std::getline(input, line)) {
    if (line.empty() || line[0] == '#') continue;
    if (!processor.handleLine(line, &response)) rejected++;
    fprintf(stdout, "%s\n", response.c_str());
    fflush(stdout);
  }

  if (rejected > 0) {
    apexLog(LogLevel::INFO, "Main", "%lu command(s) were rejected", rejected);
  }

  if (recorder.state() != RecorderState::IDLE) {
    apexLog(LogLevel::WARN, "Main", "Input ended with a ride in progress (%zu points not saved)",
            recorder.snapshot().coords.size());
  }
  return 0;
}
