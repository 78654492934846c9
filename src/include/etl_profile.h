/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief ETL configuration for HearthKernel freestanding environment.
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_ETL_PROFILE_H_
#define HEARTHKERNEL_SRC_INCLUDE_ETL_PROFILE_H_

// Use generic C++23 profile as base
#define ETL_CPP23_SUPPORTED 1

#define ETL_NO_CHECKS 0

// No exceptions in kernel
#define ETL_NO_EXCEPTIONS 1

#endif  // HEARTHKERNEL_SRC_INCLUDE_ETL_PROFILE_H_
