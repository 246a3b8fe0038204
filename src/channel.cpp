// channel.cpp — log tokens for the shared channel result codes.
#include "ordlink/channel.hpp"

namespace ordlink {

const char* to_string(SendResult r) {
  switch (r) {
    case SendResult::Ok:        return "ok";
    case SendResult::QueueFull: return "queue_full";
    case SendResult::TooLarge:  return "too_large";
  }
  return "unknown";
}

const char* to_string(ChannelError e) {
  switch (e) {
    case ChannelError::None:   return "none";
    case ChannelError::Desync: return "desync";
  }
  return "unknown";
}

} // namespace ordlink
