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
#ifndef INCLUDED_ZLINK_ZMODEM_TRANSFER_ERROR_H
#define INCLUDED_ZLINK_ZMODEM_TRANSFER_ERROR_H

#include <ostream>
#include <stdexcept>
#include <string>

namespace zlink::zmodem {

enum class TransferErrorKind {
  malformed_frame,
  unexpected_frame,
  transport_closed,
  file_io,
  peer_abort,
  peer_nak
};

std::string to_string(TransferErrorKind k);
std::ostream& operator<<(std::ostream& os, TransferErrorKind k);

/** The kind and human readable message of the failure that ended a session. */
struct TransferErrorInfo {
  TransferErrorKind kind{TransferErrorKind::file_io};
  std::string message;
};

/**
 * Thrown when a session can not be set up, i.e. the file to send can
 * not be opened or the download directory does not exist.
 */
struct transfer_error : std::runtime_error {
  transfer_error(TransferErrorKind kind, const std::string& message);
  [[nodiscard]] TransferErrorKind kind() const noexcept { return kind_; }

private:
  TransferErrorKind kind_;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_TRANSFER_ERROR_H
