// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/Copy.h>
#include <xcp/io/FileSink.h>
#include <xcp/io/FileSource.h>
#include <xcp/executor/ThreadedExecutor.h>
#include <xcp/CancellationToken.h>
#include <xcp/ExceptionHandler.h>
#include <xcp/Duration.h>
#include <xcp/RuntimeError.h>
#include <xcp/logging.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <getopt.h>
#include <signal.h>
#include <time.h>

using namespace xcp;

static void printHelp(const char* program) {
  std::cerr
      << "usage: " << program << " [options] INPUT OUTPUT" << std::endl
      << std::endl
      << "  where INPUT and OUTPUT can be '-' to be interpreted as stdin/stdout respectively." << std::endl
      << std::endl
      << "  -n, --count=BYTES        copy exactly BYTES bytes" << std::endl
      << "  -b, --buffer-size=BYTES  size of the work buffer [" << CopyOptions::DefaultBufferSize << "]" << std::endl
      << "  -t, --timeout=MSECS      give up after MSECS milliseconds" << std::endl
      << "      --no-wait            do not wait for the last cycle when cancelled" << std::endl
      << "  -L, --log-level=LEVEL    one of: trace, debug, info, notice, warning, error [notice]" << std::endl
      << "  -h, --help               print this help" << std::endl;
}

static bool parseNumber(const char* text, long long* result) {
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || value < 0)
    return false;

  *result = value;
  return true;
}

/**
 * Cancels a CancellationSource upon SIGINT or SIGTERM.
 *
 * The signals are blocked in all threads and consumed by a dedicated
 * thread, so that cancellation never runs in signal handler context.
 */
class SignalCanceller {
 public:
  explicit SignalCanceller(CancellationSource* source);
  ~SignalCanceller();

 private:
  void run();

 private:
  CancellationSource* source_;
  sigset_t signals_;
  std::atomic<bool> shutdown_;
  std::thread thread_;
};

SignalCanceller::SignalCanceller(CancellationSource* source)
    : source_(source),
      signals_(),
      shutdown_(false),
      thread_() {
  sigemptyset(&signals_);
  sigaddset(&signals_, SIGINT);
  sigaddset(&signals_, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

  thread_ = std::thread(&SignalCanceller::run, this);
}

SignalCanceller::~SignalCanceller() {
  shutdown_ = true;
  thread_.join();
}

void SignalCanceller::run() {
  while (!shutdown_.load()) {
    timespec timeout = {0, 100 * 1000 * 1000};
    int signo = sigtimedwait(&signals_, nullptr, &timeout);
    if (signo == SIGINT || signo == SIGTERM) {
      logNotice("Received signal {}. Cancelling.", signo);
      source_->cancel();
    }
  }
}

int main(int argc, char* argv[]) {
  enum { OPT_NO_WAIT = 256 };
  struct option options[] = {
    { "count", required_argument, nullptr, 'n' },
    { "buffer-size", required_argument, nullptr, 'b' },
    { "timeout", required_argument, nullptr, 't' },
    { "no-wait", no_argument, nullptr, OPT_NO_WAIT },
    { "log-level", required_argument, nullptr, 'L' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 }
  };

  long long count = -1;
  long long bufferSize = 0;
  long long timeout = 0;
  bool waitForLastOp = true;
  LogLevel logLevel = LogLevel::Notice;

  for (bool done = false; !done; ) {
    int index = 0;
    int rv = getopt_long(argc, argv, "n:b:t:L:h", options, &index);
    switch (rv) {
      case 'n':
        if (!parseNumber(optarg, &count)) {
          std::cerr << "Invalid byte count: " << optarg << std::endl;
          return 2;
        }
        break;
      case 'b':
        if (!parseNumber(optarg, &bufferSize) || bufferSize == 0) {
          std::cerr << "Invalid buffer size: " << optarg << std::endl;
          return 2;
        }
        break;
      case 't':
        if (!parseNumber(optarg, &timeout)) {
          std::cerr << "Invalid timeout: " << optarg << std::endl;
          return 2;
        }
        break;
      case OPT_NO_WAIT:
        waitForLastOp = false;
        break;
      case 'L':
        try {
          logLevel = make_loglevel(optarg);
        } catch (const RuntimeError& e) {
          std::cerr << e.what() << std::endl;
          return 2;
        }
        break;
      case 'h':
        printHelp(argv[0]);
        return 0;
      case '?':
        printHelp(argv[0]);
        return 2;
      case -1:
        done = true;
        break;
      default:
        std::cerr << "syntax error: (" << rv << ")" << std::endl;
        return 2;
    }
  }

  if (argc - optind != 2) {
    printHelp(argv[0]);
    return 2;
  }

  const std::string ifname = argv[optind];
  const std::string ofname = argv[optind + 1];

  Logger::get()->setMinimumLogLevel(logLevel);
  Logger::get()->addTarget(ConsoleLogTarget::get());

  std::shared_ptr<Source> input;
  std::shared_ptr<Sink> output;
  try {
    input = std::make_shared<FileSource>(ifname);
    output = std::make_shared<FileSink>(ofname);
  } catch (const RuntimeError& e) {
    logError("{}", e.what());
    return 1;
  }

  CancellationSource cancellation;
  SignalCanceller signalCanceller(&cancellation);

  // joins a worker still running in no-wait mode before input and output
  // get destroyed
  ThreadedExecutor executor(CatchAndLogExceptionHandler("xcopy"));

  CopyOptions copyOptions;
  copyOptions.waitForLastOp(waitForLastOp)
             .executor(&executor);
  if (bufferSize > 0)
    copyOptions.bufferSize(static_cast<size_t>(bufferSize));

  Executor::HandleRef deadline;
  if (timeout > 0) {
    deadline = cancellation.cancelAfter(
        &executor, Duration::fromMilliseconds(timeout));
  }

  logInfo("Copying from {} to {}.", ifname, ofname);

  CopyResult result = count >= 0
      ? copyN(cancellation.token(), output.get(), input.get(), count,
              copyOptions)
      : copy(cancellation.token(), output, input, copyOptions);

  if (deadline)
    deadline->cancel();

  std::cerr << result.bytesCopied << " bytes written." << std::endl;

  if (result.error) {
    logError("Copy failed. {}", result.error.message());
    return 1;
  }

  return 0;
}
