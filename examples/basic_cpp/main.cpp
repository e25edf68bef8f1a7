#include <rotalog/file_rotation_logger.hpp>
#include <rotalog/formatters/line_formatter.hpp>
#include <rotalog/rotation_observer.hpp>

#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

int main()
{
  // --- Rotation setup ---

  rotalog::RotationConfig config;
  config.suffix_policy = rotalog::SuffixPolicy::Numbering;
  config.max_file_size = 64 * 1024;
  config.max_archived_files = 3;

  // Check the file size every 1000 lines instead of the default 50000
  rotalog::RotationTuning tuning;
  tuning.check_frequency = 1000;

  auto observer = std::make_unique<rotalog::CallbackRotationObserver>(
      [](const std::string& from, const std::string& to)
      { std::printf("archived %s -> %s\n", from.c_str(), to.c_str()); },
      [](const std::string& path) { std::printf("removed %s\n", path.c_str()); });

  std::unique_ptr<rotalog::FileRotationLogger> logger;
  try
  {
    logger = std::make_unique<rotalog::FileRotationLogger>(
        "/tmp/rotalog_example/app.log", config, std::move(observer), "640", tuning);
  }
  catch (const std::exception& e)
  {
    std::fprintf(stderr, "cannot create logger: %s\n", e.what());
    return 1;
  }

  logger->SetLevel(rotalog::LogLevel::Debug);
  logger->Start();

  // --- Basic logging ---

  ROTALOG_TRACE(*logger, "filtered out by the runtime level");
  ROTALOG_DEBUG(*logger, "debug value: {}", 42);
  ROTALOG_INFO(*logger, "hello {}, version {}", "world", "1.0");
  ROTALOG_WARN(*logger, "disk usage at {}%", 85);
  logger->Log(rotalog::LogLevel::Error, "connection failed: timeout");

  // --- Enough lines from several threads to rotate a few times ---

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t)
  {
    workers.emplace_back(
        [&logger, t]
        {
          for (int i = 0; i < 2000; ++i)
          {
            ROTALOG_INFO(*logger, "worker {} iteration {}", t, i);
          }
        });
  }
  for (auto& w : workers)
  {
    w.join();
  }

  // --- Host lifecycle ---

  logger->OnEnterBackground();
  ROTALOG_INFO(*logger, "written while rotation is paused");
  logger->OnEnterForeground();

  logger->Stop();

  std::printf("rotations: %llu, dropped: %llu, write failures: %llu\n",
              static_cast<unsigned long long>(logger->RotationCount()),
              static_cast<unsigned long long>(logger->DropCount()),
              static_cast<unsigned long long>(logger->WriteFailures()));
  return 0;
}
