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
#include "zmodem/transfer_error.h"

#include "core/strings.h"

using namespace zlink::strings;

namespace zlink::zmodem {

std::string to_string(TransferErrorKind k) {
  switch (k) {
  case TransferErrorKind::malformed_frame:
    return "malformed_frame";
  case TransferErrorKind::unexpected_frame:
    return "unexpected_frame";
  case TransferErrorKind::transport_closed:
    return "transport_closed";
  case TransferErrorKind::file_io:
    return "file_io";
  case TransferErrorKind::peer_abort:
    return "peer_abort";
  case TransferErrorKind::peer_nak:
    return "peer_nak";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, TransferErrorKind k) {
  os << to_string(k);
  return os;
}

transfer_error::transfer_error(TransferErrorKind kind, const std::string& message)
    : std::runtime_error(StrCat(to_string(kind), ": ", message)), kind_(kind) {}

} // namespace zlink::zmodem
