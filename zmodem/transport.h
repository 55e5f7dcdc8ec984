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
#ifndef INCLUDED_ZLINK_ZMODEM_TRANSPORT_H
#define INCLUDED_ZLINK_ZMODEM_TRANSPORT_H

#include <string_view>

namespace zlink::zmodem {

/**
 * The byte channel to the remote peer, i.e. an SSH shell channel. Bytes
 * from the peer are delivered to StreamSniffer::OnData by the owner.
 */
class TransportAdapter {
public:
  TransportAdapter() = default;
  virtual ~TransportAdapter() = default;

  /** Sends all of data. Returns false when the transport is closed. */
  virtual bool Write(std::string_view data) = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

/** Where passthrough bytes go: the terminal emulator. */
class TerminalDisplay {
public:
  TerminalDisplay() = default;
  virtual ~TerminalDisplay() = default;
  virtual void Display(std::string_view data) = 0;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_TRANSPORT_H
