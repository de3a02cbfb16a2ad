#pragma once
// Resonance: hyperdimensional matching of free text against entity profiles
//
//   text fragments → dense embeddings → SimHash hypervectors → bundle
//   → Hamming top-k over a copy-on-write index

#include "version.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include "hypervector.hpp"
#include "projection.hpp"
#include "bundle.hpp"
#include "chunker.hpp"
#include "embedding.hpp"
#include "encoder.hpp"
#include "index.hpp"
#include "matcher.hpp"
#include "snapshot.hpp"
#include "config.hpp"
#include "profile.hpp"
#include "eval_harness.hpp"
#include "engine.hpp"

#ifdef RESONANCE_WITH_ONNX
#include "embedding_onnx.hpp"
#endif
