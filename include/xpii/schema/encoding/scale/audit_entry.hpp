#pragma once

#include <xpii/schema/audit_entry.hpp>
#include <scale/scale.hpp>

namespace xpii::schema::encoding::scale {

void encode(xpii::schema::audit_entry<1>&& o, ::scale::Encoder& encoder);
void decode(xpii::schema::audit_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace xpii::schema::encoding::scale
