/* SPDX-License-Identifier: Apache-2.0 */
#ifndef VOSKLINK_H
#define VOSKLINK_H

#include <stddef.h>

#if defined(_WIN32)
    #define VOSKLINK_API __declspec(dllexport)
#else
    #define VOSKLINK_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C"
{
#endif

/** Opaque handle to a loaded model. */
typedef struct vosklink_model vosklink_model;

/** Opaque handle to a recognizer. */
typedef struct vosklink_recognizer vosklink_recognizer;

/** Status of a boundary call. */
typedef enum vosklink_status
{
    VOSKLINK_OK = 0,
    VOSKLINK_ERR_INVALID_ARGUMENT = 1,
    VOSKLINK_ERR_MODEL_LOAD_FAILED = 2,
    VOSKLINK_ERR_RECOGNIZER_CREATION_FAILED = 3,
    VOSKLINK_ERR_RESOURCE_RELEASED = 4,
    VOSKLINK_ERR_UNKNOWN = 5,
} vosklink_status;

/** Longest accepted model path and word, in bytes. */
#define VOSKLINK_MAX_PATH_LENGTH 1023
#define VOSKLINK_MAX_WORD_LENGTH 255

/** Returns the tag of @p status, e.g. "model_load_failed". Never NULL. */
VOSKLINK_API const char* vosklink_status_name(vosklink_status status);

/** Sets the process-wide libvosk log level: negative is silent, 0 default, positive verbose. */
VOSKLINK_API void vosklink_set_log_level(int level);

/**
 * Loads a model from the directory named by the @p path_len bytes at @p path.
 * On success stores a new handle in @p out_model; release it with vosklink_model_free().
 */
VOSKLINK_API vosklink_status vosklink_model_load(const char* path, size_t path_len, vosklink_model** out_model);

/** Stores the vocabulary id of the word (or -1 if unknown) in @p out_symbol. */
VOSKLINK_API vosklink_status vosklink_model_find_word(const vosklink_model* model,
                                                      const char* word,
                                                      size_t word_len,
                                                      int* out_symbol);

/**
 * Frees the native model now while keeping the handle valid. Idempotent; NULL is
 * accepted. Later lookups on the handle fail with VOSKLINK_ERR_RESOURCE_RELEASED, and
 * recognizers created earlier keep working.
 */
VOSKLINK_API void vosklink_model_release(vosklink_model* model);

/**
 * Destroys the handle, releasing the model if this was its last owner. NULL is accepted.
 * Recognizers created from the model keep it alive. The handle must not be used, or
 * freed again, afterwards; call vosklink_model_release() for an idempotent release.
 */
VOSKLINK_API void vosklink_model_free(vosklink_model* model);

VOSKLINK_API vosklink_status vosklink_recognizer_create(const vosklink_model* model,
                                                        float sample_rate,
                                                        vosklink_recognizer** out_recognizer);

VOSKLINK_API vosklink_status vosklink_recognizer_set_max_alternatives(vosklink_recognizer* recognizer,
                                                                      int max_alternatives);
VOSKLINK_API vosklink_status vosklink_recognizer_set_words(vosklink_recognizer* recognizer, int enabled);
VOSKLINK_API vosklink_status vosklink_recognizer_set_partial_words(vosklink_recognizer* recognizer, int enabled);

/**
 * Feeds @p length bytes of PCM16LE mono audio. @p length must be even; @p data may be
 * NULL when @p length is 0. Stores 1 (utterance ended), 0 (continue) or -1 (decode
 * error) in @p out_signal. This call can take long and belongs on a thread reserved
 * for CPU-bound work.
 */
VOSKLINK_API vosklink_status vosklink_recognizer_accept_waveform(vosklink_recognizer* recognizer,
                                                                 const void* data,
                                                                 size_t length,
                                                                 int* out_signal);

/**
 * Result accessors. The returned UTF-8 JSON text is owned by the recognizer handle and
 * stays valid until the next call on the same handle. NULL on an invalid handle.
 */
VOSKLINK_API const char* vosklink_recognizer_result(vosklink_recognizer* recognizer);
VOSKLINK_API const char* vosklink_recognizer_partial_result(vosklink_recognizer* recognizer);
VOSKLINK_API const char* vosklink_recognizer_final_result(vosklink_recognizer* recognizer);

VOSKLINK_API vosklink_status vosklink_recognizer_reset(vosklink_recognizer* recognizer);

/**
 * Frees the native decoding state now while keeping the handle valid. Idempotent; NULL
 * is accepted. Later calls on the handle fail with VOSKLINK_ERR_RESOURCE_RELEASED.
 */
VOSKLINK_API void vosklink_recognizer_release(vosklink_recognizer* recognizer);

/**
 * Destroys the recognizer handle. NULL is accepted. The handle must not be used, or
 * freed again, afterwards.
 */
VOSKLINK_API void vosklink_recognizer_free(vosklink_recognizer* recognizer);

#ifdef __cplusplus
}
#endif

#endif /* VOSKLINK_H */
