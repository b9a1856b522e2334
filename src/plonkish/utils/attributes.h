#ifndef PLONKISH_UTILS_ATTRIBUTES_H_
#define PLONKISH_UTILS_ATTRIBUTES_H_

#define ALWAYS_INLINE __attribute__((always_inline)) inline

#endif  // PLONKISH_UTILS_ATTRIBUTES_H_
