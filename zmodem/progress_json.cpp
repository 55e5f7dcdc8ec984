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
#include "zmodem/progress_json.h"

#include "core/cereal_utils.h"
#include "core/log.h"
#include <algorithm>
#include <sstream>
#include <string>

#include <cereal/archives/json.hpp>
#include <cereal/specialize.hpp>
#include <cereal/types/string.hpp>

using namespace zlink::zmodem;

// Store the enums as strings, not ints.
// This has to be in the global namespace.
CEREAL_SPECIALIZE_FOR_ALL_ARCHIVES(zlink::zmodem::TransferDirection, specialization::non_member_load_save_minimal);
CEREAL_SPECIALIZE_FOR_ALL_ARCHIVES(zlink::zmodem::TransferState, specialization::non_member_load_save_minimal);

namespace cereal {

static const std::vector<std::string> kDirectionNames{"upload", "download"};
static const std::vector<std::string> kStateNames{
    "Idle",           "SendingHeader", "SendingData", "SendingEof",
    "ReceivingHeader", "ReceivingData", "Completed",   "Failed"};

template <class Archive>
std::string save_minimal(Archive const&, const TransferDirection& t) {
  return to_enum_string<TransferDirection>(t, kDirectionNames);
}
template <class Archive>
void load_minimal(Archive const&, TransferDirection& t, const std::string& s) {
  t = from_enum_string<TransferDirection>(s, kDirectionNames);
}

template <class Archive> std::string save_minimal(Archive const&, const TransferState& t) {
  return to_enum_string<TransferState>(t, kStateNames);
}
template <class Archive>
void load_minimal(Archive const&, TransferState& t, const std::string& s) {
  t = from_enum_string<TransferState>(s, kStateNames);
}

template <class Archive> void serialize(Archive& ar, TransferEvent& e) {
  SERIALIZE(e, event);
  SERIALIZE(e, session_id);
  SERIALIZE(e, channel);
  SERIALIZE(e, direction);
  SERIALIZE(e, filename);
  SERIALIZE(e, transferred);
  SERIALIZE(e, total);
  SERIALIZE(e, percent);
  SERIALIZE(e, state);
  SERIALIZE(e, idle_seconds);
  SERIALIZE(e, error_kind);
  SERIALIZE(e, error);
}

} // namespace cereal

namespace zlink::zmodem {

TransferEvent ToTransferEvent(const std::string& event, const TransferSnapshot& s) {
  TransferEvent e{};
  e.event = event;
  e.session_id = s.session_id;
  e.channel = s.channel;
  e.direction = s.direction;
  e.filename = s.filename;
  e.transferred = s.transferred;
  e.total = s.total.value_or(-1);
  e.percent = s.percent;
  e.state = s.state;
  return e;
}

std::string ToJsonLine(const TransferEvent& e) {
  std::ostringstream ss;
  try {
    cereal::JSONOutputArchive ar(ss, cereal::JSONOutputArchive::Options::NoIndent());
    auto copy = e;
    cereal::serialize(ar, copy);
  } catch (const cereal::RapidJSONException& ex) {
    LOG(ERROR) << "Caught cereal::RapidJSONException: " << ex.what();
    return {};
  }
  // Newlines only come from the formatting; those inside strings are escaped.
  auto s = ss.str();
  s.erase(std::remove(s.begin(), s.end(), '\n'), s.end());
  return s;
}

JsonEventSink::JsonEventSink(std::ostream& out) : out_(out) {}

void JsonEventSink::Write(const TransferEvent& e) {
  const auto line = ToJsonLine(e);
  if (line.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mu_);
  out_ << line << std::endl;
}

void JsonEventSink::OnProgress(const TransferSnapshot& snapshot) {
  Write(ToTransferEvent("progress", snapshot));
}

void JsonEventSink::OnStalled(session_id_t session_id, int idle_seconds) {
  TransferEvent e{};
  e.event = "stalled";
  e.session_id = session_id;
  e.idle_seconds = idle_seconds;
  Write(e);
}

void JsonEventSink::OnTransferStarted(const TransferSnapshot& snapshot) {
  Write(ToTransferEvent("started", snapshot));
}

void JsonEventSink::OnTransferCompleted(const TransferSnapshot& snapshot) {
  Write(ToTransferEvent("completed", snapshot));
}

void JsonEventSink::OnTransferError(const TransferSnapshot& snapshot,
                                    const TransferErrorInfo& error) {
  auto e = ToTransferEvent("error", snapshot);
  e.error_kind = to_string(error.kind);
  e.error = error.message;
  Write(e);
}

} // namespace zlink::zmodem
