#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/peerlink.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "peerlink/peerlink.h"
//
//  Pulls in the whole pipeline:
//    • multipart::Decoder         streaming form-data decoding
//    • ingest::ArtifactIngestor   parts → files in the upload dir
//    • CodeBroker                 invite codes and pending offers
//    • TransferListener           one-shot loopback sender
//    • RetrievalBridge            loopback receiver
//    • ShareService               HTTP routes over all of the above
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "console.h"
#include "errors.h"
#include "config.h"

// HTTP server & middleware
#include "http.h"
#include "middleware.h"

// Pipeline
#include "multipart.h"
#include "ingest.h"
#include "bundle.h"
#include "broker.h"
#include "transfer.h"
#include "bridge.h"
#include "service.h"
#include "lifecycle.h"
