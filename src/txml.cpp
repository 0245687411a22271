// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <txml/core/logger.hpp>
#include <txml/tool/scan_tool.hpp>

#include <iostream>
#include <string>

int main(int argc, char **argv)
{
  using namespace txml::tool;
  try
  {
    ToolConfig config;
    if (!parseCliArgs(argc, argv, config, std::cout))
    {
      return kExitOk;
    }
    parseTomlConfig(config);

    txml::core::Logger::init(txml::core::Logger::levelFromString(config.logLevel.value_or("warning")),
                             config.logFile.value_or(""));

    std::string mode = resolveMode(config);
    int status = processFiles(mode, config.files, std::cout, std::cerr);
    txml::core::Logger::shutdown();
    return status;
  }
  catch (const UsageError &e)
  {
    std::cerr << "txml: " << e.what() << "\n";
    printHelp(std::cout);
    return kExitUsage;
  }
  catch (const std::exception &e)
  {
    std::cerr << "txml: " << e.what() << std::endl;
    return kExitUsage;
  }
}
