#pragma once
#include <Eigen/Dense>
#include <cnpy.h>

#include <filesystem>
#include <string>

namespace weight_utils {
    // Pull one named array out of a loaded .npz archive.
    // Throws std::runtime_error if it's missing, not float32, or the wrong rank.
    Eigen::RowVectorXf load_1d_tensor(const cnpy::npz_t& archive, const std::string& name);
    Eigen::MatrixXf load_2d_tensor(const cnpy::npz_t& archive, const std::string& name);

    // Append one array to an .npz archive (first call should use mode "w").
    void save_1d_tensor(const std::filesystem::path& path, const std::string& name,
                        const Eigen::RowVectorXf& vector, const std::string& mode = "a");
    void save_2d_tensor(const std::filesystem::path& path, const std::string& name,
                        const Eigen::MatrixXf& tensor, const std::string& mode = "a");

    // Verify tensor dimensions match expected shape
    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name = "[no_name]");
    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name = "[no_name]");
}
