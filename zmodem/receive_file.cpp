/**************************************************************************/
/*                                                                        */
/*                   zlink - terminal file transfer engine                */
/*             Copyright (C)2025-2026, zlink developers                   */
/*                                                                        */
/*    Licensed  under the  Apache License, Version  2.0 (the "License");  */
/*    you may not use this  file  except in compliance with the License.  */
/*    You may obtain a copy of the License at                             */
/*                                                                        */
/*                http://www.apache.org/licenses/LICENSE-2.0              */
/*                                                                        */
/*    Unless  required  by  applicable  law  or agreed to  in  writing,   */
/*    software  distributed  under  the  License  is  distributed on an   */
/*    "AS IS"  BASIS, WITHOUT  WARRANTIES  OR  CONDITIONS OF ANY  KIND,   */
/*    either  express  or implied.  See  the  License for  the specific   */
/*    language governing permissions and limitations under the License.   */
/**************************************************************************/
#include "zmodem/receive_file.h"

#include "core/file.h"
#include "core/log.h"
#include "core/strings.h"
#include "zmodem/transfer_error.h"
#include "zmodem/wfile_transfer_file.h"
#include <string>

using namespace zlink::core;
using namespace zlink::strings;

namespace zlink::zmodem {

static constexpr int kMaxUniqueNameAttempts = 1000;
static constexpr char kDefaultReceiveName[] = "received_file";

std::string SanitizeFilename(const std::string& filename) {
  std::string out;
  out.reserve(filename.size());
  for (const auto c : filename) {
    switch (c) {
    case '/':
    case '\\':
    case ':':
    case '*':
    case '?':
    case '"':
    case '<':
    case '>':
    case '|':
      out.push_back('_');
      break;
    default:
      if (static_cast<unsigned char>(c) < 32) {
        out.push_back('_');
      } else {
        out.push_back(c);
      }
    }
  }
  if (out.empty() || out == "." || out == "..") {
    return kDefaultReceiveName;
  }
  return out;
}

std::filesystem::path UniqueReceivePath(const std::filesystem::path& dir,
                                        const std::string& filename) {
  const auto safe = SanitizeFilename(filename);
  auto candidate = FilePath(dir, safe);
  if (!File::Exists(candidate)) {
    return candidate;
  }
  const std::filesystem::path p{safe};
  const auto stem = p.stem().string();
  const auto ext = p.extension().string();
  for (auto i = 1; i < kMaxUniqueNameAttempts; i++) {
    candidate = FilePath(dir, StrCat(stem, "_", i, ext));
    if (!File::Exists(candidate)) {
      VLOG(1) << "Renamed received file " << safe << " to " << candidate.filename().string();
      return candidate;
    }
  }
  throw transfer_error(TransferErrorKind::file_io,
                       StrCat("No free name for ", safe, " in ", dir.string()));
}

receive_file_factory_t DirectoryReceiveFileFactory(const std::filesystem::path& dir) {
  if (!File::is_directory(dir)) {
    throw transfer_error(TransferErrorKind::file_io,
                         StrCat("Download directory does not exist: ", dir.string()));
  }
  return [dir](const FileHeader& header) -> std::unique_ptr<TransferFile> {
    const auto path = UniqueReceivePath(dir, header.filename);
    LOG(INFO) << "Receiving " << header.filename << " as " << path.string();
    return WFileTransferFile::CreateForReceive(path);
  };
}

} // namespace zlink::zmodem
