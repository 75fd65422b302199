#pragma once
#include <string>
#include <string_view>

#include "Utils/Result.hpp"
#include "Virtualization/vm/VmRecord.hpp"

namespace glidex::VmRecordCodec {

// {"id","name","state","config":{"vcpu_count","mem_size_mib","kernel_image_path","rootfs_path","kernel_args"?}}
[[nodiscard]] std::string encode(const VmRecord& record);

// StorageError on malformed input
[[nodiscard]] Result<VmRecord> decode(std::string_view json);

} // namespace glidex::VmRecordCodec
