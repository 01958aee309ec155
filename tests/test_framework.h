/*
 * test_framework.h - Minimal unit test framework for DiagStream tests
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TEST_FRAMEWORK_H
#define TEST_FRAMEWORK_H

#include <string>
#include <vector>
#include <memory>
#include <iostream>
#include <sstream>
#include <exception>
#include <chrono>
#include <functional>
#include <typeinfo>

namespace TestFramework {

    // ========================================
    // ASSERTION MACROS
    // ========================================
    
    /**
     * @brief Assert that a condition is true
     * @param condition The condition to test
     * @param message Descriptive message for failure
     */
    #define ASSERT_TRUE(condition, message) \
        do { \
            if (!(condition)) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: true, Got: false"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    #define ASSERT_FALSE(condition, message) \
        do { \
            if ((condition)) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: false, Got: true"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    /**
     * @brief Assert that two values are equal
     * @param expected The expected value
     * @param actual The actual value
     * @param message Descriptive message for failure
     */
    #define ASSERT_EQUALS(expected, actual, message) \
        do { \
            if (!((expected) == (actual))) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: " << (expected) << ", Got: " << (actual); \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    #define ASSERT_NOT_EQUALS(expected, actual, message) \
        do { \
            if ((expected) == (actual)) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected values to be different, but both were: " << (actual); \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    #define ASSERT_NOT_NULL(ptr, message) \
        do { \
            if ((ptr) == nullptr) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: non-null pointer, Got: null"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    #define ASSERT_NULL(ptr, message) \
        do { \
            if ((ptr) != nullptr) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: null pointer, Got: non-null"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)

    // ========================================
    // EXCEPTION CLASSES
    // ========================================
    
    class AssertionFailure : public std::exception {
    public:
        explicit AssertionFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };
    
    /**
     * @brief Thrown from setUp() when a fixture cannot be created
     */
    class TestSetupFailure : public std::exception {
    public:
        explicit TestSetupFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };

    // ========================================
    // TEST RESULT STRUCTURES
    // ========================================
    
    enum class TestResult {
        PASSED,     ///< Test completed successfully
        FAILED,     ///< Test failed with assertion error
        ERROR,      ///< Test failed with unexpected error
        SKIPPED     ///< Test was skipped
    };
    
    struct TestInfo {
        std::string name;                           ///< Test function name
        TestResult result;                          ///< Test result status
        std::string failure_message;                ///< Error message if failed
        std::chrono::milliseconds execution_time;   ///< Time taken to execute
        
        TestInfo(const std::string& test_name) 
            : name(test_name), result(TestResult::PASSED), execution_time(0) {}
    };

    // ========================================
    // TEST CASE BASE CLASS
    // ========================================
    
    /**
     * @brief Base class for a single test with setUp/tearDown hooks
     */
    class TestCase {
    public:
        explicit TestCase(const std::string& name);
        virtual ~TestCase() = default;
        
        /**
         * @brief Run setUp, runTest and tearDown, capturing the outcome
         */
        TestInfo run();
        
        const std::string& getName() const;
        bool hasPassed() const;
        const std::vector<std::string>& getFailures() const;
        
    protected:
        virtual void runTest() = 0;
        virtual void setUp() {}
        virtual void tearDown() {}
        
        void addFailure(const std::string& message);
        
    private:
        void safeTearDown(TestInfo& info);

        std::string m_name;                     ///< Test case name
        bool m_passed;                          ///< Whether test passed
        std::vector<std::string> m_failures;   ///< Collected failure messages
    };

    // ========================================
    // TEST SUITE CLASS
    // ========================================
    
    class TestSuite {
    public:
        explicit TestSuite(const std::string& name);
        
        void addTest(std::unique_ptr<TestCase> test);
        void addTest(const std::string& name, std::function<void()> test_func);
        
        std::vector<TestInfo> runAll();
        TestInfo runTest(const std::string& test_name);
        
        void printResults(const std::vector<TestInfo>& results);
        
        /**
         * @brief Number of FAILED and ERROR results
         */
        int getFailureCount(const std::vector<TestInfo>& results);
        int getPassedCount(const std::vector<TestInfo>& results);
        std::chrono::milliseconds getTotalTime(const std::vector<TestInfo>& results);
        
        const std::string& getName() const;
        size_t getTestCount() const;
        std::vector<std::string> getTestNames() const;
        
    private:
        std::string m_name;                                 ///< Suite name
        std::vector<std::unique_ptr<TestCase>> m_tests;    ///< Owned test cases
    };

    // ========================================
    // FUNCTION-BASED TEST WRAPPER
    // ========================================
    
    class FunctionTestCase : public TestCase {
    public:
        FunctionTestCase(const std::string& name, std::function<void()> test_func);
        
    protected:
        void runTest() override;
        
    private:
        std::function<void()> m_test_func;
    };

    // ========================================
    // COMMON TEST PATTERNS
    // ========================================
    
    namespace TestPatterns {
        
        /**
         * @brief Assert that test_func throws ExceptionType
         * @param expected_message Substring the exception message must contain (empty: any)
         */
        template<typename ExceptionType>
        void assertThrows(std::function<void()> test_func, const std::string& expected_message = "", const std::string& message = "Expected exception was not thrown") {
            bool exception_thrown = false;
            std::string actual_message;
            
            try {
                test_func();
            } catch (const ExceptionType& e) {
                exception_thrown = true;
                actual_message = e.what();
                
                if (!expected_message.empty() && actual_message.find(expected_message) == std::string::npos) {
                    std::ostringstream oss;
                    oss << "Exception message mismatch - Expected to contain: '" 
                        << expected_message << "', Got: '" << actual_message << "'";
                    throw AssertionFailure(oss.str());
                }
            } catch (const AssertionFailure&) {
                throw;
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << "Wrong exception type thrown - Expected: " << typeid(ExceptionType).name() 
                    << ", Got: " << typeid(e).name() << " with message: " << e.what();
                throw AssertionFailure(oss.str());
            }
            
            if (!exception_thrown) {
                throw AssertionFailure(message);
            }
        }
        
        void assertNoThrow(std::function<void()> test_func, const std::string& message = "Unexpected exception was thrown");
    }

} // namespace TestFramework

#endif // TEST_FRAMEWORK_H
