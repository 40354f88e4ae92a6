#include <sonde/common/status.hpp>

const char*
sonde_status_to_str(sonde_status status) {
  switch(status) {
    case SONDE_OK:
      return "Ok";
    case SONDE_TIMEOUT:
      return "Timeout";
    case SONDE_QUEUE_CLOSED:
      return "Queue Closed";
    case SONDE_DUPLICATE_WORKLOAD:
      return "Duplicate Workload";
    case SONDE_NODE_LISTING_ERROR:
      return "Node Listing Error";
    case SONDE_DISPATCH_ERROR:
      return "Dispatch Error";
    case SONDE_ANNOTATION_ERROR:
      return "Annotation Error";
    case SONDE_CERTIFICATE_ERROR:
      return "Certificate Error";
    case SONDE_KEY_GENERATION_ERROR:
      return "Key Generation Error";
    case SONDE_INVALID_ADDRESS:
      return "Invalid Address";
    case SONDE_INVALID_IP:
      return "Invalid IP";
    case SONDE_TRANSPORT_ERROR:
      return "Transport Error";
    case SONDE_CONNECTION_CLOSED:
      return "Connection Closed";
    case SONDE_PARSE_ERROR:
      return "Parse Error";
    case SONDE_IO_ERROR:
      return "IO Error";
    case SONDE_GENERIC_ERROR:
      return "Generic Error";
  }
  return "!!!!";
}
