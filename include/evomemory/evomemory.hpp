#pragma once
// EvoMemory: episodic memory for a text-generation engine
//
// - Types: Neurons, Rules, Skills, Mood
// - Storage: SQLite-backed NeuronStore
// - Scoring: heuristic self-confidence of generated text
// - Retrieval: BM25 prompt context (RAG-Lite)
// - Evolution: rule mining over recent neurons
// - Memory: unified API

#include "version.hpp"
#include "types.hpp"
#include "text.hpp"
#include "storage.hpp"
#include "scoring.hpp"
#include "keywords.hpp"
#include "retrieval.hpp"
#include "evolution.hpp"
#include "config.hpp"
#include "memory.hpp"
