#pragma once

// Single source of truth for the PeerBeam version.
// Printed by `peerbeam --version` and the signaling broker banner.
#define PEERBEAM_VERSION_MAJOR  1
#define PEERBEAM_VERSION_MINOR  0
#define PEERBEAM_VERSION_PATCH  0
#define PEERBEAM_VERSION_STRING "1.0.0"
