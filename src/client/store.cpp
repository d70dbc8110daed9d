#include "client/store.hpp"

namespace mostrix::client {

bool IsTerminalStatus(protocol::Status status) {
  switch (status) {
    case protocol::Status::kCanceled:
    case protocol::Status::kCanceledByAdmin:
    case protocol::Status::kSettledByAdmin:
    case protocol::Status::kCompletedByAdmin:
    case protocol::Status::kExpired:
    case protocol::Status::kSuccess:
    case protocol::Status::kCooperativelyCanceled:
      return true;
    default:
      return false;
  }
}

bool IsFinalizedDisputeStatus(protocol::DisputeStatus status) {
  return status == protocol::DisputeStatus::kSettled ||
         status == protocol::DisputeStatus::kSellerRefunded ||
         status == protocol::DisputeStatus::kReleased;
}

}  // namespace mostrix::client
