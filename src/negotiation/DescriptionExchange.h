#pragma once
#include "EventQueue.h"
#include <string>

namespace PeerBeam {

    // How the two peers swap session descriptions. Results come back as
    // events on the queue handed to Start():
    //   RoomReady, PeerJoined, RemoteDescription, SignalingError, SignalingClosed.
    class DescriptionExchange {
    public:
        virtual ~DescriptionExchange() = default;

        virtual void Start(EventQueue& events) = 0;
        // False when there is no room to create or join (manual copy/paste).
        virtual bool UsesRoom() const = 0;

        virtual void CreateRoom(const std::string& roomId) = 0;
        virtual void JoinRoom(const std::string& roomId) = 0;

        virtual void PublishOffer(const std::string& roomId, const std::string& fileId,
            const std::string& blob) = 0;
        virtual void PublishAnswer(const std::string& roomId, const std::string& blob) = 0;

        // Called when the negotiator starts waiting for the counterpart's
        // description. Push-based exchanges need not do anything.
        virtual void RequestRemoteDescription() = 0;

        virtual void Close() = 0;
    };

} // namespace PeerBeam
