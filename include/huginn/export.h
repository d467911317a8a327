#pragma once

/**
 * @file export.h
 * @brief DLL export/import macros for Huginn library
 *
 * NOTE: With WINDOWS_EXPORT_ALL_SYMBOLS, CMake auto-generates exports.
 *       HUGINN_API is kept as empty macro for compatibility but has no effect.
 */

// HUGINN_API is a no-op - WINDOWS_EXPORT_ALL_SYMBOLS handles exports
#define HUGINN_API
