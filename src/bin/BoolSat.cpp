// Copyright 2024-2025 keplertech.io
// SPDX-License-Identifier: GPL-3.0-only

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Problem.h"
#include "Runner.h"
#include "SolverConfig.h"
#include "SolverLogger.h"

using namespace BOOLSAT;

static void print_usage(const char* prog) {
  std::printf("Usage: %s [--config <file>] <problem.yaml>\n", prog);
}

int main(int argc, char** argv) {
  const auto mainStart{std::chrono::steady_clock::now()};

  if (argc < 2) {
    print_usage(argv[0]);
    return EXIT_SUCCESS;
  }

  std::string configPath;
  std::vector<std::string> inputPaths;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      return EXIT_SUCCESS;
    }
    if (a == "--config" || a == "-c") {
      if (i + 1 >= argc) {
        SPDLOG_CRITICAL("Missing config file after {}", a);
        return EXIT_FAILURE;
      }
      configPath = argv[++i];
      continue;
    }
    inputPaths.push_back(a);
  }

  // Basic validation
  if (inputPaths.size() != 1) {
    SPDLOG_CRITICAL("Need exactly one problem path; got {}", inputPaths.size());
    print_usage(argv[0]);
    return EXIT_FAILURE;
  }

  SolverConfig config;
  try {
    if (!configPath.empty()) {
      config = SolverConfig::loadFile(configPath);
    }
    SolverLogger::init(config.logFile, SolverLogger::parseLevel(config.logLevel));
  } catch (const std::exception& e) {
    SPDLOG_CRITICAL("{}", e.what());
    return EXIT_FAILURE;
  }
  auto logger = SolverLogger::get();

  logger->info("BOOLSAT: Run.");
  logger->info("Problem: {}", inputPaths[0]);
  logger->info("Mode: {}",
               config.mode == SolverConfig::Mode::SOLVE ? "solve" : "enumerate");

  int status = EXIT_SUCCESS;
  try {
    Problem problem = Problem::loadFile(inputPaths[0]);
    status = Runner::run(problem, config, std::cout);
  } catch (const std::exception& e) {
    logger->error("Workflow failed: {}", e.what());
    return EXIT_FAILURE;
  }

  const auto mainEnd{std::chrono::steady_clock::now()};
  const std::chrono::duration<double> mainElapsedSeconds{mainEnd - mainStart};
  logger->info("boolsat done in: {}s", mainElapsedSeconds.count());
  return status;
}
