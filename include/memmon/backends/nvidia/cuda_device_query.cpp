#if !(MEMMON_ENABLE_NVIDIA && MEMMON_HAS_CUDA)
#error "cuda_device_query.cpp should only be compiled when MEMMON_ENABLE_NVIDIA && MEMMON_HAS_CUDA are true."
#endif

#include "memmon/backends/nvidia/cuda_device_query.hpp"
#include "memmon/core/aggregate_data.hpp"

#include <cstdint>
#include <sstream>

namespace memmon::nvidia {

    void CudaDeviceQuery::check(const cudaError_t r, const char* what) {
        if (r == cudaSuccess) return;
        const char* s = cudaGetErrorString(r);
        throw DeviceQueryError(std::string(what) + " failed: " + (s ? s : "unknown cuda error"));
    }

    int CudaDeviceQuery::resolveIndex(const DeviceRef& device) {
        if (device.index) return *device.index;
        int current = 0;
        check(cudaGetDevice(&current), "cudaGetDevice");
        return current;
    }

    int64_t CudaDeviceQuery::poolAttribute(const int deviceId, const cudaMemPoolAttr attr) {
        cudaMemPool_t pool{};
        check(cudaDeviceGetDefaultMemPool(&pool, deviceId), "cudaDeviceGetDefaultMemPool");

        uint64_t value = 0;
        check(cudaMemPoolGetAttribute(pool, attr, &value), "cudaMemPoolGetAttribute");
        return static_cast<int64_t>(value);
    }

    bool CudaDeviceQuery::isAvailable(std::string* reason) const {
        int count = 0;
        const cudaError_t r = cudaGetDeviceCount(&count);
        if (r != cudaSuccess || count == 0) {
            if (reason) {
                *reason = r != cudaSuccess
                    ? std::string("cudaGetDeviceCount failed: ") + cudaGetErrorString(r)
                    : std::string("no CUDA devices found");
            }
            cudaGetLastError();
            return false;
        }

        int supported = 0;
        if (cudaDeviceGetAttribute(&supported, cudaDevAttrMemoryPoolsSupported, 0) != cudaSuccess || !supported) {
            if (reason) *reason = "CUDA memory pools are not supported on this device";
            cudaGetLastError();
            return false;
        }
        return true;
    }

    MemInfo CudaDeviceQuery::memInfo(const DeviceRef& device) {
        const int id = resolveIndex(device);

        int previous = 0;
        check(cudaGetDevice(&previous), "cudaGetDevice");
        if (previous != id) check(cudaSetDevice(id), "cudaSetDevice");

        size_t freeBytes = 0, totalBytes = 0;
        const cudaError_t r = cudaMemGetInfo(&freeBytes, &totalBytes);

        if (previous != id) cudaSetDevice(previous);
        check(r, "cudaMemGetInfo");

        return MemInfo{static_cast<int64_t>(freeBytes), static_cast<int64_t>(totalBytes)};
    }

    // Default-pool attributes: stream-ordered allocations only.
    AllocatorStats CudaDeviceQuery::allocatorStats(const DeviceRef& device) {
        const int id = resolveIndex(device);
        AllocatorStats out;
        out[keys::kActive]       = poolAttribute(id, cudaMemPoolAttrUsedMemCurrent);
        out[keys::kActivePeak]   = poolAttribute(id, cudaMemPoolAttrUsedMemHigh);
        out[keys::kReserved]     = poolAttribute(id, cudaMemPoolAttrReservedMemCurrent);
        out[keys::kReservedPeak] = poolAttribute(id, cudaMemPoolAttrReservedMemHigh);
        return out;
    }

    void CudaDeviceQuery::resetPeakStats(const DeviceRef& device) {
        const int id = resolveIndex(device);
        cudaMemPool_t pool{};
        check(cudaDeviceGetDefaultMemPool(&pool, id), "cudaDeviceGetDefaultMemPool");

        // High-water attributes may only be set to zero.
        uint64_t zero = 0;
        check(cudaMemPoolSetAttribute(pool, cudaMemPoolAttrUsedMemHigh, &zero), "cudaMemPoolSetAttribute");
        check(cudaMemPoolSetAttribute(pool, cudaMemPoolAttrReservedMemHigh, &zero), "cudaMemPoolSetAttribute");
    }

    std::map<std::string, int64_t> CudaDeviceQuery::rawStats(const DeviceRef& device) {
        const int id = resolveIndex(device);
        return {
            {"used_bytes.current",     poolAttribute(id, cudaMemPoolAttrUsedMemCurrent)},
            {"used_bytes.peak",        poolAttribute(id, cudaMemPoolAttrUsedMemHigh)},
            {"reserved_bytes.current", poolAttribute(id, cudaMemPoolAttrReservedMemCurrent)},
            {"reserved_bytes.peak",    poolAttribute(id, cudaMemPoolAttrReservedMemHigh)},
            {"release_threshold_bytes", poolAttribute(id, cudaMemPoolAttrReleaseThreshold)},
        };
    }

    std::string CudaDeviceQuery::memorySummary(const DeviceRef& device) {
        const int id = resolveIndex(device);

        cudaDeviceProp prop{};
        check(cudaGetDeviceProperties(&prop, id), "cudaGetDeviceProperties");

        const MemInfo mi = memInfo(device);
        const AllocatorStats stats = allocatorStats(device);

        std::ostringstream oss;
        oss << "|===========================================================|\n"
            << "| CUDA memory summary, device " << id << " (" << prop.name << ")\n"
            << "|-----------------------------------------------------------|\n"
            << "| device total      " << toMiBCeil(mi.totalBytes) << " MiB\n"
            << "| device free       " << toMiBCeil(mi.freeBytes) << " MiB\n"
            << "| pool used         " << toMiBCeil(stats.at(keys::kActive))
            << " MiB (peak " << toMiBCeil(stats.at(keys::kActivePeak)) << " MiB)\n"
            << "| pool reserved     " << toMiBCeil(stats.at(keys::kReserved))
            << " MiB (peak " << toMiBCeil(stats.at(keys::kReservedPeak)) << " MiB)\n"
            << "| pool figures count cudaMallocAsync allocations only\n"
            << "|===========================================================|";
        return oss.str();
    }

} // namespace memmon::nvidia
