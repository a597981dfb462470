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

#include "error.hpp"
#include "resources.hpp"
#include "revocation.hpp"
#include "detail/client-profile.hpp"
#include "detail/json-helper.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>

namespace acmemsg {

NDN_LOG_INIT(acmemsg.tools.inspect);

using Reencoder = std::function<JsonValue(const JsonValue&, JsonMode)>;

template<class MessageType>
static Reencoder
makeReencoder()
{
  return [] (const JsonValue& json, JsonMode mode) {
    auto message = MessageType::fromJson(json);
    return mode == JsonMode::FULL ? message.toJson() : message.toPartialJson();
  };
}

static const std::map<std::string, Reencoder>&
getMessageTypes()
{
  static const std::map<std::string, Reencoder> types{
    {"error", [] (const JsonValue& json, JsonMode mode) {
       auto error = Error::fromJson(json);
       std::cerr << error << std::endl;
       return mode == JsonMode::FULL ? error.toJson() : error.toPartialJson();
     }},
    {"registration", makeReencoder<Registration>()},
    {"registration-resource", makeReencoder<RegistrationResource>()},
    {"challenge", makeReencoder<ChallengeBody>()},
    {"challenge-resource", makeReencoder<ChallengeResource>()},
    {"identifier", makeReencoder<Identifier>()},
    {"authorization", makeReencoder<Authorization>()},
    {"authorization-resource", makeReencoder<AuthorizationResource>()},
    {"certificate-request", makeReencoder<CertificateRequest>()},
    {"revocation", makeReencoder<Revocation>()},
  };
  return types;
}

static JsonValue
readMessage(const std::string& fileName)
{
  std::ostringstream document;
  if (fileName == "-") {
    document << std::cin.rdbuf();
  }
  else {
    std::ifstream file(fileName);
    if (!file) {
      NDN_THROW(std::runtime_error("Cannot open " + fileName));
    }
    document << file.rdbuf();
  }
  return json::parse(document.str());
}

static int
main(int argc, char* argv[])
{
  namespace po = boost::program_options;
  std::string messageType;
  std::string fileName = "-";
  std::string directory;
  std::string profileFile;
  po::options_description description(
    "Usage: acmemsg-inspect [-h] [-p] type [file]\n"
    "       acmemsg-inspect -r DIRECTORY\n"
    "       acmemsg-inspect -c FILE\n"
    "\n"
    "Options");
  description.add_options()
    ("help,h", "produce help message")
    ("partial,p", "print the partial serialization instead of the full one")
    ("revoke-url,r", po::value<std::string>(&directory), "print the revocation endpoint of a directory URL")
    ("profile,c", po::value<std::string>(&profileFile), "print the new-registration payload of a client profile")
    ("type", po::value<std::string>(&messageType), "message type, e.g., authorization")
    ("file", po::value<std::string>(&fileName), "JSON message file, or '-' for standard input");
  po::positional_options_description p;
  p.add("type", 1);
  p.add("file", 1);
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(description).positional(p).run(), vm);
    po::notify(vm);
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }
  if (vm.count("help") != 0) {
    std::cerr << description << std::endl;
    std::cerr << "Message types:";
    for (const auto& item : getMessageTypes()) {
      std::cerr << " " << item.first;
    }
    std::cerr << std::endl;
    return 0;
  }

  try {
    if (vm.count("revoke-url") != 0) {
      std::cout << Revocation::url(directory) << std::endl;
      return 0;
    }

    if (vm.count("profile") != 0) {
      ClientProfile profile;
      profile.load(profileFile);
      std::cout << json::toString(profile.makeRegistration().toPartialJson());
      return 0;
    }

    if (vm.count("type") == 0) {
      std::cerr << "ERROR: you must specify a message type." << std::endl;
      return 2;
    }
    auto it = getMessageTypes().find(messageType);
    if (it == getMessageTypes().end()) {
      std::cerr << "ERROR: unknown message type " << messageType << std::endl;
      return 2;
    }

    auto mode = vm.count("partial") != 0 ? JsonMode::PARTIAL : JsonMode::FULL;
    auto message = readMessage(fileName);
    NDN_LOG_DEBUG("Decoding " << fileName << " as " << messageType);
    std::cout << json::toString(it->second(message, mode));
  }
  catch (const DecodeError& e) {
    std::cerr << "ERROR: invalid " << messageType << ": " << e.what() << std::endl;
    return 3;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

} // namespace acmemsg

int
main(int argc, char* argv[])
{
  return acmemsg::main(argc, argv);
}
