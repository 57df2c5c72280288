/*
 * 
 *   Copyright 2016 RIFT.IO Inc
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 *
 */



/*!
 * @file yangc_ut.h
 *
 * Helpers shared by the yangc unit tests.
 */

#ifndef YANGC_UT_H_
#define YANGC_UT_H_

#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "yang_builder.hpp"
#include "yang_errors.hpp"

/*!
 * Record a description of the test case in the XML report.
 */
#define TEST_DESCRIPTION(desc) ::testing::Test::RecordProperty("description", desc)

/*!
 * Serves module sources from memory and counts the fetches.
 */
class MemoryFetcher
{
 public:
  MemoryFetcher() {}

  // Cannot copy
  MemoryFetcher(const MemoryFetcher&) = delete;
  MemoryFetcher& operator=(const MemoryFetcher&) = delete;

 public:
  void add(const std::string& name, const std::string& text)
  {
    texts_[name] = text;
  }

  yangc::yang_fetch_fn_t fetch_fn()
  {
    return [this](const std::string& name) -> std::string {
      fetched_.push_back(name);
      auto it = texts_.find(name);
      if (it == texts_.end()) {
        throw yangc::ModelProcessingError("Cannot find yang '" + name + "'");
      }
      return it->second;
    };
  }

  const std::vector<std::string>& fetched() const { return fetched_; }

 private:
  std::map<std::string, std::string> texts_;
  std::vector<std::string> fetched_;
};

/*!
 * A fresh directory below the system temp directory, removed with
 * everything in it when the object goes away.
 */
class TempDirectory
{
 public:
  TempDirectory()
  : path_(boost::filesystem::temp_directory_path()
          / boost::filesystem::unique_path("yangc-ut-%%%%-%%%%-%%%%"))
  {
    boost::filesystem::create_directories(path_);
  }

  ~TempDirectory()
  {
    boost::system::error_code ec;
    boost::filesystem::remove_all(path_, ec);
  }

  // Cannot copy
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

 public:
  const boost::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

  //! Write a file below the directory, creating its parents.
  std::string write(const std::string& relative, const std::string& text) const;

 private:
  boost::filesystem::path path_;
};

inline std::string TempDirectory::write(const std::string& relative,
                                        const std::string& text) const
{
  boost::filesystem::path file = path_ / relative;
  boost::filesystem::create_directories(file.parent_path());
  boost::filesystem::ofstream out(file);
  out << text;
  return file.string();
}

/*!
 * Run fn and return the message of the exception of type E it throws,
 * or an empty string when it returns normally.
 */
template <typename E, typename Fn>
std::string error_message(const Fn& fn)
{
  try {
    fn();
  } catch (const E& e) {
    return e.what();
  }
  return std::string();
}

#endif // YANGC_UT_H_
