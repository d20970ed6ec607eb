#ifndef IDCARD_H
#define IDCARD_H

// Open ID Card Validator - Main include header
// Include this file to access all idcard functionality

#include "idcard/types.h"
#include "idcard/validator.h"
#include "idcard/identity.h"
#include "idcard/cn_id.h"
#include "idcard/hk_id.h"
#include "idcard/mo_id.h"
#include "idcard/tw_id.h"
#include "idcard/region.h"
#include "idcard/fake.h"

namespace idcard {

// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace idcard

#endif // IDCARD_H
