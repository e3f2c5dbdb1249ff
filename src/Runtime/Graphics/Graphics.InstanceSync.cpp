module;
#include <cstddef>
#include <mutex>
#include <span>
#include <string>
#include <utility>

module Graphics:InstanceSync.Impl;
import :InstanceSync;
import :Model;
import RHI;
import Core.Error;
import Core.Logging;

namespace Graphics
{
    Core::Result SyncInstanceBuffer(Model& model, RHI::IDevice& device)
    {
        std::lock_guard lock(model.Mutex);

        const size_t required = model.GetRequiredBufferSize();
        if (required == 0)
        {
            model.InstanceBuffer.reset();
            return Core::Ok();
        }

        const auto bytes = std::as_bytes(std::span(model.Instances));

        if (model.InstanceBuffer && model.InstanceBuffer->GetSizeBytes() == required)
        {
            if (auto written = device.WriteBuffer(*model.InstanceBuffer, 0, bytes); !written)
            {
                Core::Log::Error("Model '{}': instance buffer write failed ({})", model.Name,
                                 Core::ErrorCodeToString(written.error()));
                return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
            }
            return Core::Ok();
        }

        RHI::BufferDesc desc;
        desc.SizeBytes = required;
        desc.Usage = RHI::BufferUsage::Vertex;
        desc.HostVisible = true;
        desc.InitialData = bytes;
        desc.Label = model.Name + ".Instances";

        auto buffer = device.CreateBuffer(desc);
        if (!buffer)
        {
            Core::Log::Error("Model '{}': instance buffer allocation of {} bytes failed ({})", model.Name, required,
                             Core::ErrorCodeToString(buffer.error()));
            return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
        }

        Core::Log::Debug("Model '{}': instance buffer reallocated for {} instance(s)", model.Name,
                         model.Instances.size());
        model.InstanceBuffer = std::move(*buffer);
        return Core::Ok();
    }
}
