// TrialFlow-Prod headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"
#include "io/FrameDriver.hpp"
#include "io/FrameSink.hpp"
#include "io/ResponseDevice.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <filesystem>
#include <fstream>
#include <sstream>

namespace trialflow::test {

  using core::Value;

  namespace {
    std::string slurp(const std::filesystem::path& p) {
      std::ifstream in(p);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    std::filesystem::path scratch(const std::string& name) {
      return std::filesystem::temp_directory_path() / ("trialflow_io_" + name);
    }
  } // namespace

  TEST(FileLoggerTest, BuffersUntilFlushAndClose) {
    auto path = scratch("file_logger.csv");
    {
      io::FileLogger log;
      ASSERT_TRUE(log.open(path.string()));
      log.write("a,b\n");
      EXPECT_EQ(slurp(path), "");
      EXPECT_TRUE(log.flush());
      EXPECT_EQ(slurp(path), "a,b\n");
      log.write("c,d\n");

      io::FileLogger moved = std::move(log);
      EXPECT_FALSE(log.isOpen());
      EXPECT_TRUE(moved.isOpen());
    }
    EXPECT_EQ(slurp(path), "a,b\nc,d\n");
    std::filesystem::remove(path);
  }

  TEST(FileLoggerTest, OpenFailsForMissingDirectory) {
    io::FileLogger log;
    EXPECT_FALSE(log.open((scratch("missing_dir") / "x.csv").string()));
    EXPECT_FALSE(log.flush());
  }

  TEST(LoggerTest, WritesCsvRowsInOrder) {
    auto path = scratch("run_log.csv");
    core::Logger logger(path.string());
    logger.startNewRun();
    ASSERT_TRUE(logger.running());
    logger.log(core::LogEvent{ core::LogEvent::Kind::LoopEntered, 0.5, "trials", "nReps=3" });
    logger.log(core::LogEvent{ core::LogEvent::Kind::Variable, 1.25, "label", "a, \"b\"" });
    logger.finishRun();
    EXPECT_FALSE(logger.running());

    EXPECT_EQ(slurp(path), "seq,t,event,subject,detail\n"
                           "0,0.5000,loop_entered,trials,nReps=3\n"
                           "1,1.2500,variable,label,\"a, \"\"b\"\"\"\n");
    std::filesystem::remove(path);
  }

  TEST(LoggerTest, EmptyPathDisablesLogging) {
    core::Logger logger;
    EXPECT_FALSE(logger.enabled());
    logger.startNewRun();
    logger.log(core::LogEvent{});
    EXPECT_FALSE(logger.running());
  }

  TEST(LoggerTest, UnwritablePathThrows) {
    core::Logger logger((scratch("missing_dir") / "run.csv").string());
    EXPECT_THROW(logger.startNewRun(), std::runtime_error);
  }

  TEST(FrameDriverTest, FixedRateTimestampsAndFrameCap) {
    io::FixedRateFrameDriver driver(50.0, 3);
    EXPECT_DOUBLE_EQ(driver.framePeriod(), 0.02);

    auto first = driver.nextFrame();
    EXPECT_EQ(first.frameN, 0u);
    EXPECT_DOUBLE_EQ(first.t, 0.0);
    driver.nextFrame();
    EXPECT_FALSE(driver.escapeRequested());
    auto third = driver.nextFrame();
    EXPECT_DOUBLE_EQ(third.t, 0.04);
    EXPECT_TRUE(driver.escapeRequested());
    EXPECT_EQ(driver.current().frameN, 2u);
  }

  TEST(FrameDriverTest, RejectsNonPositiveRate) {
    EXPECT_THROW(io::FixedRateFrameDriver(0.0), std::invalid_argument);
  }

  TEST(HeadlessFrameSinkTest, CountsDrawsAndFlips) {
    io::HeadlessFrameSink sink;
    sink.draw(io::DrawCommand{ "stim", "shape", {} });
    sink.flip(io::FrameTick{});
    EXPECT_EQ(sink.draws(), 1u);
    EXPECT_EQ(sink.flips(), 1u);
  }

  //---ResponseDevice -------------------------------------------------------

  TEST(ResponseDeviceTest, RelaysToListenersAndStores) {
    io::ResponseDevice device("keyboard");
    std::vector<double> heard;
    EXPECT_TRUE(device.addListener("tap", [&](const io::Response& r) { heard.push_back(r.t); }));
    EXPECT_FALSE(device.addListener("tap", [](const io::Response&) {}));
    EXPECT_TRUE(device.addListener("log", [](const io::Response&) {}));
    EXPECT_THAT(device.listenerNames(), ::testing::ElementsAre("tap", "log"));

    const auto& r = device.makeResponse(0.3, Value(std::string("space")));
    EXPECT_EQ(r.value, Value(std::string("space")));
    EXPECT_THAT(heard, ::testing::ElementsAre(0.3));
    EXPECT_EQ(device.responses().size(), 1u);

    EXPECT_TRUE(device.removeListener("tap"));
    EXPECT_FALSE(device.removeListener("tap"));
    device.makeResponse(0.4, Value(1.0));
    EXPECT_EQ(heard.size(), 1u);
    EXPECT_EQ(device.listenerCount(), 1u);

    device.clearListeners();
    EXPECT_EQ(device.listenerCount(), 0u);
  }

  TEST(ResponseDeviceTest, ResponseJsonCarriesAllFields) {
    io::Response r{ 1.5, Value(2.0), 0.1, -0.2 };
    auto msg = nlohmann::json::parse(r.toJson());
    EXPECT_EQ(msg["type"], "hardware_response");
    EXPECT_EQ(msg["class"], "PointerResponse");
    EXPECT_DOUBLE_EQ(msg["data"]["t"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(msg["data"]["y"].get<double>(), -0.2);
  }

  TEST(ScriptedPointerTest, DispatchesOnlyDueResponses) {
    io::ScriptedPointer pointer;
    pointer.schedule(io::Response{ 0.1, Value(1.0), 0.0, 0.0 });
    pointer.schedule(io::Response{ 0.5, Value(1.0), 0.0, 0.0 });
    EXPECT_THROW(pointer.schedule(io::Response{ 0.2, Value(1.0), 0.0, 0.0 }), std::invalid_argument);

    pointer.dispatchMessages(0.3);
    EXPECT_EQ(pointer.responses().size(), 1u);
    EXPECT_EQ(pointer.pending(), 1u);

    pointer.clearResponses(0.6);
    EXPECT_TRUE(pointer.responses().empty());
    EXPECT_EQ(pointer.pending(), 0u);
  }

} // namespace trialflow::test
