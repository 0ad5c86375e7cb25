// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <dirent.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include "logger.h"
#include "util_string.h"

namespace mvis { namespace file {

// Sorted names (not paths) of the entries in dir_name, skipping hidden files.
inline std::vector<std::string> getFilesInDir(const std::string& dir_name)
{
  std::vector<std::string> filenames;
  DIR* dtemp;
  dirent* dent;
  dtemp = opendir(dir_name.c_str());
  if (!dtemp) return std::vector<std::string>();
  while (true) {
    dent = readdir(dtemp);
    if (!dent) break;
    if (std::string(dent->d_name)[0] == '.') continue;
    filenames.push_back(std::string(dent->d_name));
  }
  closedir(dtemp);

  std::sort(filenames.begin(), filenames.end());
  return filenames;
}

inline std::string filenameExtension(const std::string& filename)
{
  const std::vector<std::string> tokens = string::split(filename, '.');
  XCHECK_GE(tokens.size(), 1);
  std::string ext = tokens[tokens.size() - 1];
  // Convert all extensions to lowercase (".mp4", ".jpg", etc)
  std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
  return ext;
}

inline std::string lastDirInPath(std::string path)
{
  XCHECK_GE(path.size(), 1);
  if (path[path.size() - 1] == '/') path.pop_back();
  const std::vector<std::string> tokens = string::split(path, '/');
  XCHECK_GE(tokens.size(), 1);
  return tokens[tokens.size() - 1];
}

inline bool directoryExists(const std::filesystem::path& dir_path)
{
  return std::filesystem::is_directory(dir_path);
}

inline bool fileExists(const std::filesystem::path& file_path)
{
  return std::filesystem::exists(file_path) && !directoryExists(file_path);
}

inline bool createDirectoryIfNotExists(const std::filesystem::path& dir) {
  if (!std::filesystem::is_directory(dir)) {
    std::filesystem::create_directories(dir);
    return true;
  }
  return false;
}

// Every directory under root (root included) that directly contains a subdirectory named
// sentinel, in sorted order. The sentinel directories themselves are not descended into.
inline std::vector<std::string> findDirsContaining(
    const std::string& root, const std::string& sentinel)
{
  namespace fs = std::filesystem;
  std::vector<std::string> found;
  if (!directoryExists(root)) return found;

  if (directoryExists(fs::path(root) / sentinel)) found.push_back(fs::path(root).string());

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  XCHECK(!ec) << "cannot walk " << root << ": " << ec.message();
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    XCHECK(!ec) << "cannot walk " << root << ": " << ec.message();
    if (!it->is_directory()) continue;
    if (it->path().filename() == sentinel) {
      it.disable_recursion_pending();
      continue;
    }
    if (directoryExists(it->path() / sentinel)) found.push_back(it->path().string());
  }

  std::sort(found.begin(), found.end());
  return found;
}

// Path components of path below root, e.g. ("/a/b", "/a/b/c/d/e") -> {"c", "d", "e"}
inline std::vector<std::string> relativePathComponents(
    const std::string& root, const std::string& path)
{
  auto normalized = [](const std::string& s) {
    std::filesystem::path p = std::filesystem::path(s).lexically_normal();
    if (!p.has_filename() && p.has_parent_path()) p = p.parent_path();  // drop trailing '/'
    return p;
  };
  std::vector<std::string> parts;
  const std::filesystem::path rel = normalized(path).lexically_relative(normalized(root));
  for (const auto& p : rel) {
    const std::string s = p.string();
    if (s.empty() || s == ".") continue;
    parts.push_back(s);
  }
  return parts;
}

}}  // namespace mvis::file
