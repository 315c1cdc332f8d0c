#ifndef VLC_CORE_PROTOBUF_FWD_HPP
#define VLC_CORE_PROTOBUF_FWD_HPP

namespace vlc {
namespace core {
namespace protobuf {

class OrdinaryClock;
class AttestedClock;
class UpdateRequest;
class UpdateResponse;
class AttestationPayload;
class AttestationDocument;
class WorkerConfig;
class PortalConfig;
class ClockInfo;
class MergeLog;

}
}
}

#endif
