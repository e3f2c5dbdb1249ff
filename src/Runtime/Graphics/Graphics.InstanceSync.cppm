export module Graphics:InstanceSync;

import RHI;
import Core.Error;
import :Model;

export namespace Graphics
{
    // Mirrors model.Instances into model.InstanceBuffer. Takes model.Mutex.
    //  - count unchanged (same byte size): rewrite in place, no allocation
    //  - count changed or no buffer yet: allocate a new buffer with the records, drop the old one
    //  - zero instances: drop the buffer
    [[nodiscard]] Core::Result SyncInstanceBuffer(Model& model, RHI::IDevice& device);
}
