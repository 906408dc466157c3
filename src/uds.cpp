#include "ecudiag/uds.hpp"

namespace ecudiag {

const char* service_name(uint8_t sid) {
  switch (static_cast<SID>(sid)) {
    case SID::DiagnosticSessionControl: return "DiagnosticSessionControl";
    case SID::ECUReset: return "ECUReset";
    case SID::SecurityAccess: return "SecurityAccess";
    case SID::CommunicationControl: return "CommunicationControl";
    case SID::Authentication: return "Authentication";
    case SID::TesterPresent: return "TesterPresent";
    case SID::AccessTimingParameters: return "AccessTimingParameters";
    case SID::SecuredDataTransmission: return "SecuredDataTransmission";
    case SID::ControlDTCSetting: return "ControlDTCSetting";
    case SID::ResponseOnEvent: return "ResponseOnEvent";
    case SID::LinkControl: return "LinkControl";
    case SID::ReadDataByIdentifier: return "ReadDataByIdentifier";
    case SID::ReadMemoryByAddress: return "ReadMemoryByAddress";
    case SID::ReadScalingDataByIdentifier: return "ReadScalingDataByIdentifier";
    case SID::ReadDataByPeriodicIdentifier: return "ReadDataByPeriodicIdentifier";
    case SID::DynamicallyDefineDataIdentifier: return "DynamicallyDefineDataIdentifier";
    case SID::WriteDataByIdentifier: return "WriteDataByIdentifier";
    case SID::WriteMemoryByAddress: return "WriteMemoryByAddress";
    case SID::ClearDiagnosticInformation: return "ClearDiagnosticInformation";
    case SID::ReadDTCInformation: return "ReadDTCInformation";
    case SID::InputOutputControlByIdentifier: return "InputOutputControlByIdentifier";
    case SID::RoutineControl: return "RoutineControl";
    case SID::RequestDownload: return "RequestDownload";
    case SID::RequestUpload: return "RequestUpload";
    case SID::TransferData: return "TransferData";
    case SID::RequestTransferExit: return "RequestTransferExit";
    case SID::RequestFileTransfer: return "RequestFileTransfer";
  }
  return "Unknown";
}

SessionKind classify_session(uint8_t session_type) {
  switch (session_type) {
    case 0x01: return SessionKind::Default;
    case 0x02: return SessionKind::Programming;
    case 0x03: return SessionKind::Extended;
    case 0x04: return SessionKind::SafetySystem;
    default: break;
  }
  if (session_type >= 0x40 && session_type <= 0x5F) return SessionKind::VehicleManufacturer;
  if (session_type >= 0x60 && session_type <= 0x7E) return SessionKind::SystemSupplier;
  return SessionKind::Reserved;
}

} // namespace ecudiag
