#include "utils/weight_utils.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace weight_utils {
    namespace {
        using RowMajorMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

        const cnpy::NpyArray& lookup(const cnpy::npz_t& archive, const std::string& name, size_t rank) {
            auto it = archive.find(name);
            if (it == archive.end()) {
                throw std::runtime_error("Missing tensor '" + name + "' in weights archive");
            }
            const cnpy::NpyArray& arr = it->second;
            if (arr.word_size != sizeof(float)) {
                throw std::runtime_error("Tensor '" + name + "' is not float32 (word size " +
                    std::to_string(arr.word_size) + ")");
            }
            if (arr.shape.size() != rank) {
                throw std::runtime_error("Tensor '" + name + "' has rank " + std::to_string(arr.shape.size()) +
                    ", expected " + std::to_string(rank));
            }
            return arr;
        }
    }

    Eigen::RowVectorXf load_1d_tensor(const cnpy::npz_t& archive, const std::string& name) {
        const cnpy::NpyArray& arr = lookup(archive, name, 1);
        return Eigen::Map<const Eigen::RowVectorXf>(arr.data<float>(), arr.shape[0]);
    }

    Eigen::MatrixXf load_2d_tensor(const cnpy::npz_t& archive, const std::string& name) {
        const cnpy::NpyArray& arr = lookup(archive, name, 2);
        const auto rows = static_cast<Eigen::Index>(arr.shape[0]);
        const auto cols = static_cast<Eigen::Index>(arr.shape[1]);

        // numpy defaults to C order, Eigen to column major. Map with the right
        // layout and let the assignment do the shuffle.
        if (arr.fortran_order) {
            return Eigen::Map<const Eigen::MatrixXf>(arr.data<float>(), rows, cols);
        }
        return Eigen::Map<const RowMajorMatrixXf>(arr.data<float>(), rows, cols);
    }

    void save_1d_tensor(const std::filesystem::path& path, const std::string& name,
                        const Eigen::RowVectorXf& vector, const std::string& mode) {
        cnpy::npz_save(path.string(), name, vector.data(), {static_cast<size_t>(vector.size())}, mode);
    }

    void save_2d_tensor(const std::filesystem::path& path, const std::string& name,
                        const Eigen::MatrixXf& tensor, const std::string& mode) {
        // npz_save always writes C order
        RowMajorMatrixXf row_major = tensor;
        cnpy::npz_save(path.string(), name, row_major.data(),
            {static_cast<size_t>(tensor.rows()), static_cast<size_t>(tensor.cols())}, mode);
    }

    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name) {
        if (tensor.rows() != rows || tensor.cols() != cols) {
            std::ostringstream oss;
            oss << "Tensor shape mismatch for '" << tensor_name << "'.\n";
            oss << "Expected dimensions [" << rows << ", " << cols << "]\n";
            oss << "Got dimensions [" << tensor.rows() << ", " << tensor.cols() << "]\n";
            throw std::runtime_error(oss.str());
        }
    }

    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name) {
        if (vector.size() != size) {
            std::ostringstream oss;
            oss << "Vector shape mismatch for '" << vector_name << "'.\n";
            oss << "Expected dimensions [" << size << "]\n";
            oss << "Got dimensions [" << vector.size() << "]\n";
            throw std::runtime_error(oss.str());
        }
    }
}
