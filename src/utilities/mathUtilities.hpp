#ifndef GASDYNLIBRARY_MATHUTILITIES_HPP
#define GASDYNLIBRARY_MATHUTILITIES_HPP
#include <petsc.h>
#include <stdexcept>
#include <string>

namespace gasdyn::utilities {
class MathUtilities {
   public:
    /**
     * Finds the root of function inside [lower, upper] using Newton's method safeguarded by bisection.  Any Newton step that leaves the current bracket is replaced with a bisection step, so
     * convergence is guaranteed for continuous functions that change sign across the bracket.
     * @param function f(x)
     * @param derivative df/dx
     * @param lower lower bound of the bracket
     * @param upper upper bound of the bracket
     * @param guess initial guess, clamped into the bracket
     * @param tolerance relative change in x that stops the iteration
     * @param maxIterations
     * @return the root
     */
    template <class F, class DF>
    static PetscReal FindBracketedRoot(const F& function, const DF& derivative, PetscReal lower, PetscReal upper, PetscReal guess, PetscReal tolerance = 1.0E-14, PetscInt maxIterations = 200) {
        PetscReal fLower = function(lower);
        PetscReal fUpper = function(upper);
        if (fLower == 0.0) {
            return lower;
        }
        if (fUpper == 0.0) {
            return upper;
        }
        if ((fLower > 0.0) == (fUpper > 0.0)) {
            throw std::invalid_argument("The root is not bracketed by [" + std::to_string(lower) + ", " + std::to_string(upper) + "]");
        }

        PetscReal x = (guess > lower && guess < upper) ? guess : 0.5 * (lower + upper);
        for (PetscInt i = 0; i < maxIterations; i++) {
            PetscReal f = function(x);
            if (f == 0.0) {
                return x;
            }

            // shrink the bracket around the root
            if ((f > 0.0) == (fLower > 0.0)) {
                lower = x;
                fLower = f;
            } else {
                upper = x;
            }

            PetscReal df = derivative(x);
            PetscReal xNew = x - f / df;
            if (!PetscIsNormalReal(df) || !(xNew > lower && xNew < upper)) {
                xNew = 0.5 * (lower + upper);
            }

            if (PetscAbsReal(xNew - x) <= tolerance * PetscAbsReal(xNew)) {
                return xNew;
            }
            x = xNew;
        }

        throw std::runtime_error("Can't find root; iteration not converging after " + std::to_string(maxIterations) + " iterations");
    }

   private:
    MathUtilities() = delete;
};
}  // namespace gasdyn::utilities
#endif  // GASDYNLIBRARY_MATHUTILITIES_HPP
