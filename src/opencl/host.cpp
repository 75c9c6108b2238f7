#include "host.h"
#include <iostream>
#include <fstream>
#include <sstream>

OpenCLHost::OpenCLHost()
    : platform_(nullptr), device_(nullptr), context_(nullptr), queue_(nullptr),
      supports_fp64_(false), initialized_(false) {
}

OpenCLHost::~OpenCLHost() {
    cleanup();
}

std::string OpenCLHost::deviceString(cl_device_id device, cl_device_info param) {
    size_t len = 0;
    if (clGetDeviceInfo(device, param, 0, nullptr, &len) != CL_SUCCESS || len == 0) {
        return "";
    }
    std::string value(len, '\0');
    clGetDeviceInfo(device, param, len, &value[0], nullptr);
    // Drop the trailing NUL the runtime includes in len
    while (!value.empty() && value.back() == '\0') {
        value.pop_back();
    }
    return value;
}

bool OpenCLHost::initialize(const std::string& device_hint) {
    if (initialized_) {
        std::cerr << "OpenCL already initialized" << std::endl;
        return false;
    }

    if (!selectDevice(device_hint)) {
        return false;
    }

    cl_int err = CL_SUCCESS;
    context_ = clCreateContext(nullptr, 1, &device_, nullptr, nullptr, &err);
    if (err != CL_SUCCESS) {
        std::cerr << "ERROR: Failed to create OpenCL context: " << err << std::endl;
        std::cerr << "  Run 'clinfo' to verify OpenCL setup" << std::endl;
        context_ = nullptr;
        return false;
    }

    // OpenCL 1.2 entry point, deprecated in 2.0 headers
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    queue_ = clCreateCommandQueue(context_, device_, CL_QUEUE_PROFILING_ENABLE, &err);
    #pragma GCC diagnostic pop
    if (err != CL_SUCCESS) {
        std::cerr << "ERROR: Failed to create command queue: " << err << std::endl;
        queue_ = nullptr;
        clReleaseContext(context_);
        context_ = nullptr;
        return false;
    }

    device_name_ = deviceString(device_, CL_DEVICE_NAME);
    std::string extensions = deviceString(device_, CL_DEVICE_EXTENSIONS);
    supports_fp64_ = extensions.find("cl_khr_fp64") != std::string::npos;

    std::cerr << "OpenCL initialized: " << device_name_
              << (supports_fp64_ ? " (fp64)" : " (no fp64)") << std::endl;

    initialized_ = true;
    return true;
}

bool OpenCLHost::selectDevice(const std::string& device_hint) {
    cl_uint num_platforms = 0;
    cl_int err = clGetPlatformIDs(0, nullptr, &num_platforms);
    if (err != CL_SUCCESS || num_platforms == 0) {
        std::cerr << "ERROR: No OpenCL platforms found (error " << err << ")" << std::endl;
        return false;
    }

    std::vector<cl_platform_id> platforms(num_platforms);
    err = clGetPlatformIDs(num_platforms, platforms.data(), nullptr);
    if (err != CL_SUCCESS) {
        std::cerr << "ERROR: Failed to get platform IDs: " << err << std::endl;
        return false;
    }

    // GPUs first, then anything the platforms expose
    const cl_device_type passes[] = {CL_DEVICE_TYPE_GPU, CL_DEVICE_TYPE_ALL};
    cl_platform_id first_platform = nullptr;
    cl_device_id first_device = nullptr;

    for (cl_device_type type : passes) {
        for (cl_platform_id platform : platforms) {
            cl_uint num_devices = 0;
            if (clGetDeviceIDs(platform, type, 0, nullptr, &num_devices) != CL_SUCCESS || num_devices == 0) {
                continue;
            }
            std::vector<cl_device_id> devices(num_devices);
            if (clGetDeviceIDs(platform, type, num_devices, devices.data(), nullptr) != CL_SUCCESS) {
                continue;
            }
            for (cl_device_id device : devices) {
                if (first_device == nullptr) {
                    first_platform = platform;
                    first_device = device;
                }
                if (!device_hint.empty() &&
                    deviceString(device, CL_DEVICE_NAME).find(device_hint) != std::string::npos) {
                    platform_ = platform;
                    device_ = device;
                    return true;
                }
            }
        }
        if (first_device != nullptr && device_hint.empty()) {
            break;
        }
    }

    if (first_device == nullptr) {
        std::cerr << "ERROR: No OpenCL devices found" << std::endl;
        return false;
    }
    if (!device_hint.empty()) {
        std::cerr << "No device matching '" << device_hint << "', using first device" << std::endl;
    }
    platform_ = first_platform;
    device_ = first_device;
    return true;
}

bool OpenCLHost::loadKernel(const std::string& kernel_file, const std::string& kernel_name,
                            const std::string& build_options) {
    if (!initialized_) {
        std::cerr << "OpenCL not initialized" << std::endl;
        return false;
    }
    if (findEntry(kernel_name) != nullptr) {
        return true;
    }

    std::ifstream file(kernel_file);
    if (!file.is_open()) {
        std::cerr << "Failed to open kernel file: " << kernel_file << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source = buffer.str();
    if (source.empty()) {
        std::cerr << "Kernel file is empty: " << kernel_file << std::endl;
        return false;
    }

    const char* source_str = source.c_str();
    size_t source_len = source.length();
    cl_int err = CL_SUCCESS;
    cl_program program = clCreateProgramWithSource(context_, 1, &source_str, &source_len, &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to create program: " << err << std::endl;
        return false;
    }

    err = clBuildProgram(program, 1, &device_, build_options.c_str(), nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t log_size = 0;
        clGetProgramBuildInfo(program, device_, CL_PROGRAM_BUILD_LOG, 0, nullptr, &log_size);
        std::string log(log_size, '\0');
        if (log_size > 0) {
            clGetProgramBuildInfo(program, device_, CL_PROGRAM_BUILD_LOG, log_size, &log[0], nullptr);
        }
        std::cerr << "Failed to build " << kernel_file << ":\n" << log << std::endl;
        clReleaseProgram(program);
        return false;
    }

    cl_kernel kernel = clCreateKernel(program, kernel_name.c_str(), &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to create kernel " << kernel_name << ": " << err << std::endl;
        clReleaseProgram(program);
        return false;
    }

    kernels_.push_back(KernelEntry{kernel_name, program, kernel, nullptr});
    return true;
}

cl_mem OpenCLHost::createBuffer(cl_mem_flags flags, size_t size, void* host_ptr) {
    if (!initialized_) {
        return nullptr;
    }
    cl_int err = CL_SUCCESS;
    cl_mem buffer = clCreateBuffer(context_, flags, size, host_ptr, &err);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to create buffer of " << size << " bytes: " << err << std::endl;
        return nullptr;
    }
    return buffer;
}

bool OpenCLHost::writeBuffer(cl_mem buffer, size_t size, const void* data) {
    if (!initialized_ || buffer == nullptr) {
        return false;
    }
    cl_int err = clEnqueueWriteBuffer(queue_, buffer, CL_TRUE, 0, size, data, 0, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to write buffer: " << err << std::endl;
        return false;
    }
    return true;
}

bool OpenCLHost::readBuffer(cl_mem buffer, size_t size, void* data) {
    if (!initialized_ || buffer == nullptr) {
        return false;
    }
    cl_int err = clEnqueueReadBuffer(queue_, buffer, CL_TRUE, 0, size, data, 0, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to read buffer: " << err << std::endl;
        return false;
    }
    return true;
}

void OpenCLHost::releaseBuffer(cl_mem buffer) {
    if (buffer != nullptr) {
        clReleaseMemObject(buffer);
    }
}

OpenCLHost::KernelEntry* OpenCLHost::findEntry(const std::string& kernel_name) {
    for (auto& entry : kernels_) {
        if (entry.name == kernel_name) {
            return &entry;
        }
    }
    return nullptr;
}

cl_kernel OpenCLHost::getKernel(const std::string& kernel_name) {
    KernelEntry* entry = findEntry(kernel_name);
    return entry ? entry->kernel : nullptr;
}

bool OpenCLHost::enqueueKernel(const std::string& kernel_name, size_t global_work_size) {
    KernelEntry* entry = findEntry(kernel_name);
    if (!initialized_ || entry == nullptr) {
        std::cerr << "Kernel not loaded: " << kernel_name << std::endl;
        return false;
    }
    if (entry->last_event != nullptr) {
        clReleaseEvent(entry->last_event);
        entry->last_event = nullptr;
    }

    cl_int err = clEnqueueNDRangeKernel(queue_, entry->kernel, 1, nullptr, &global_work_size,
                                        nullptr, 0, nullptr, &entry->last_event);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to enqueue " << kernel_name << ": " << err << std::endl;
        entry->last_event = nullptr;
        return false;
    }
    return true;
}

void OpenCLHost::finish() {
    if (queue_ != nullptr) {
        clFinish(queue_);
    }
}

double OpenCLHost::getKernelTime(const std::string& kernel_name) {
    KernelEntry* entry = findEntry(kernel_name);
    if (entry == nullptr || entry->last_event == nullptr) {
        return 0.0;
    }
    clWaitForEvents(1, &entry->last_event);
    cl_ulong start = 0;
    cl_ulong end = 0;
    if (clGetEventProfilingInfo(entry->last_event, CL_PROFILING_COMMAND_START, sizeof(start), &start, nullptr) != CL_SUCCESS ||
        clGetEventProfilingInfo(entry->last_event, CL_PROFILING_COMMAND_END, sizeof(end), &end, nullptr) != CL_SUCCESS) {
        return 0.0;
    }
    return static_cast<double>(end - start) / 1e6;
}

void OpenCLHost::cleanup() {
    for (auto& entry : kernels_) {
        if (entry.last_event) clReleaseEvent(entry.last_event);
        if (entry.kernel) clReleaseKernel(entry.kernel);
        if (entry.program) clReleaseProgram(entry.program);
    }
    kernels_.clear();

    if (queue_) {
        clReleaseCommandQueue(queue_);
        queue_ = nullptr;
    }
    if (context_) {
        clReleaseContext(context_);
        context_ = nullptr;
    }
    device_ = nullptr;
    platform_ = nullptr;
    initialized_ = false;
}
