#pragma once

#include <chrono>
#include <exception>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>


namespace Utils
{
    class Timer
    {
        public:
            Timer(): start_time(std::chrono::high_resolution_clock::now()) {}

            double stop()
            {
                auto end_time = std::chrono::high_resolution_clock::now();
                return std::chrono::duration<double, std::milli>(end_time - start_time).count();
            }

        private:
            std::chrono::time_point<std::chrono::high_resolution_clock> start_time;
    };

    template<typename Func, typename... Args>
    auto measureTime(Func func, Args&&... args)
    {
        Timer timer;
        auto result = func(std::forward<Args>(args)...);
        double elapsed_time = timer.stop();
        return std::make_pair(elapsed_time, result);
    }


    template <typename Func, typename... Args>
    auto measureTimeWithMessage(std::string_view startMessage, Func func, Args&&... args)
    {
        spdlog::info(startMessage);
        auto [time, result] = measureTime(func, std::forward<Args>(args)...);
        spdlog::info("Execution time: {}ms", time);
        return result;
    }


    // Calls c(i) for every index of items in parallel.
    // First exception thrown by c stops the loop and is rethrown.
    template<typename T, typename C>
    void forEach(const T& items, C&& c)
    {
        const auto size = items.size();
        std::exception_ptr exception = nullptr;

        #pragma omp parallel for
        for(size_t i = 0; i < size; i++)
        {
            try
            {
                c(static_cast<size_t>(i));
            }
            catch (...)
            {
                #pragma omp critical
                {
                    if (!exception)
                        exception = std::current_exception();
                }
    #ifdef MSVC
                break;
    #else
                #pragma omp cancel for
    #endif
            }
        }

        if (exception)
            std::rethrow_exception(exception);
    }


    bool isImageFile(const std::filesystem::path& path);
    std::vector<std::filesystem::path> collectImages(std::span<const std::filesystem::path> inputs);
    int threadsToUse(int requested, int available);
}
