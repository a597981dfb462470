/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2024, Regents of the University of California.
 *
 * This file is part of acmemsg, the ACME message model of a certificate management client.
 *
 * acmemsg is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * acmemsg is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * acmemsg, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of acmemsg authors and contributors.
 */

#include "tests/global-configuration.hpp"

#include <ndn-cxx/util/exception.hpp>
#include <ndn-cxx/util/logging.hpp>

#include <stdexcept>
#include <stdlib.h>
#include <system_error>

namespace acmemsg::tests {

const std::filesystem::path GlobalConfiguration::TESTDIR{UNIT_TESTS_TMPDIR};

GlobalConfiguration::GlobalConfiguration()
{
  // in case an earlier test run crashed without a chance to run the destructor
  std::filesystem::remove_all(TESTDIR);
  if (!std::filesystem::create_directories(TESTDIR)) {
    NDN_THROW(std::runtime_error("Cannot create " + TESTDIR.string()));
  }

  // decode failures are logged at TRACE; ACMEMSG_TEST_LOG=acmemsg.*=TRACE shows them
  const char* logConfig = ::getenv("ACMEMSG_TEST_LOG");
  if (logConfig != nullptr) {
    ndn::util::Logging::setLevel(logConfig);
  }
}

GlobalConfiguration::~GlobalConfiguration() noexcept
{
  std::error_code ec;
  std::filesystem::remove_all(TESTDIR, ec); // ignore error
}

std::string
GlobalConfiguration::makeTestPath(const std::string& fileName)
{
  return (TESTDIR / fileName).string();
}

BOOST_TEST_GLOBAL_CONFIGURATION(GlobalConfiguration);

} // namespace acmemsg::tests
