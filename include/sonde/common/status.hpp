#ifndef SONDE_COMMON_STATUS_HPP
#define SONDE_COMMON_STATUS_HPP

#include <ostream>

typedef enum sonde_status {
  SONDE_OK,
  SONDE_TIMEOUT,
  SONDE_QUEUE_CLOSED,
  SONDE_DUPLICATE_WORKLOAD,
  SONDE_NODE_LISTING_ERROR,
  SONDE_DISPATCH_ERROR,
  SONDE_ANNOTATION_ERROR,
  SONDE_CERTIFICATE_ERROR,
  SONDE_KEY_GENERATION_ERROR,
  SONDE_INVALID_ADDRESS,
  SONDE_INVALID_IP,
  SONDE_TRANSPORT_ERROR,
  SONDE_CONNECTION_CLOSED,
  SONDE_PARSE_ERROR,
  SONDE_IO_ERROR,
  SONDE_GENERIC_ERROR
} sonde_status;

const char*
sonde_status_to_str(sonde_status status);

inline std::ostream&
operator<<(std::ostream& o, sonde_status status) {
  return o << sonde_status_to_str(status);
}

#endif
