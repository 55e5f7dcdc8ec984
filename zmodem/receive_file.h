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
#ifndef INCLUDED_ZLINK_ZMODEM_RECEIVE_FILE_H
#define INCLUDED_ZLINK_ZMODEM_RECEIVE_FILE_H

#include "zmodem/file_header.h"
#include "zmodem/transfer_file.h"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace zlink::zmodem {

/**
 * Opens the local file for a download once the peer's ZFILE header has
 * been read. Throws transfer_error when no file can be created.
 */
typedef std::function<std::unique_ptr<TransferFile>(const FileHeader& header)>
    receive_file_factory_t;

/**
 * Returns filename with path separators and characters not allowed in
 * filenames replaced by '_'. An empty name becomes "received_file".
 */
std::string SanitizeFilename(const std::string& filename);

/**
 * Returns a path in dir for filename that does not exist yet: the sanitized
 * name, or name_N.ext for the first free N. Throws transfer_error(file_io)
 * when no free name is found.
 */
std::filesystem::path UniqueReceivePath(const std::filesystem::path& dir,
                                        const std::string& filename);

/** A factory creating each received file under dir with a unique, safe name. */
receive_file_factory_t DirectoryReceiveFileFactory(const std::filesystem::path& dir);

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_RECEIVE_FILE_H
