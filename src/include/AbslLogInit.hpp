#pragma once

#include <filesystem>

/**
 * Initializes the Abseil Logging library for ChunkXfer binaries.
 * Lowers the stderr threshold so INFO lines reach the console.
 *
 * @note Expected to be called exactly once, before anything logs.
 */
extern void ChunkXfer_AbslLogInit();

/**
 * Mirrors every log entry into the given file, in addition to stderr.
 *
 * @return false if the file could not be opened.
 */
extern bool ChunkXfer_AbslLogToFile(const std::filesystem::path& filename);

/**
 * Removes the file sink added by ChunkXfer_AbslLogToFile, if any.
 */
extern void ChunkXfer_AbslLogDeInit();
