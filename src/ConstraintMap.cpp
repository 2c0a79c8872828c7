#include "clumpfit/ConstraintMap.hpp"
#include "clumpfit/Errors.hpp"
#include <cctype>
#include <cstdlib>
#include <functional>

namespace clumpfit {
namespace {

/* ------------------------------------------------------------------------- */
/*  recursive-descent parser                                                 */
/* ------------------------------------------------------------------------- */
class ExprParser {
public:
    explicit ExprParser(const std::string& s) : s_(s) {}

    LinearExpr parse()
    {
        LinearExpr e = expr();
        skip_ws();
        if (pos_ != s_.size())
            fail("unexpected '" + std::string(1, s_[pos_]) + "'");
        return e;
    }

private:
    [[noreturn]] void fail(const std::string& what) const
    {
        throw ConstraintResolutionError("Cannot parse constraint '" + s_ + "': " + what);
    }

    void skip_ws() { while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_; }

    bool accept(char ch)
    {
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == ch) { ++pos_; return true; }
        return false;
    }

    static LinearExpr scaled(LinearExpr e, double f)
    {
        for (auto& [n, c] : e.coeffs) c *= f;
        e.constant *= f;
        return e;
    }

    static void add_into(LinearExpr& acc, const LinearExpr& e, double sign)
    {
        for (const auto& [n, c] : e.coeffs) acc.coeffs[n] += sign * c;
        acc.constant += sign * e.constant;
    }

    LinearExpr expr()
    {
        LinearExpr acc = term();
        for (;;) {
            if      (accept('+')) add_into(acc, term(),  1.0);
            else if (accept('-')) add_into(acc, term(), -1.0);
            else return acc;
        }
    }

    LinearExpr term()
    {
        LinearExpr acc = factor();
        for (;;) {
            if (accept('*')) {
                LinearExpr rhs = factor();
                if (acc.is_constant())      acc = scaled(rhs, acc.constant);
                else if (rhs.is_constant()) acc = scaled(acc, rhs.constant);
                else fail("product of two parameters is not linear");
            } else if (accept('/')) {
                LinearExpr rhs = factor();
                if (!rhs.is_constant()) fail("division by a parameter is not linear");
                if (rhs.constant == 0.0) fail("division by zero");
                acc = scaled(acc, 1.0 / rhs.constant);
            } else {
                return acc;
            }
        }
    }

    LinearExpr factor()
    {
        if (accept('-')) return scaled(factor(), -1.0);
        if (accept('+')) return factor();
        if (accept('(')) {
            LinearExpr e = expr();
            if (!accept(')')) fail("missing ')'");
            return e;
        }

        skip_ws();
        if (pos_ >= s_.size()) fail("unexpected end of expression");

        const char ch = s_[pos_];
        if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '.') {
            const char* begin = s_.c_str() + pos_;
            char* end = nullptr;
            const double v = std::strtod(begin, &end);
            if (end == begin) fail("bad number");
            pos_ += static_cast<std::size_t>(end - begin);
            LinearExpr e;
            e.constant = v;
            return e;
        }
        if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_') {
            std::size_t start = pos_;
            while (pos_ < s_.size() &&
                   (std::isalnum(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '_'))
                ++pos_;
            LinearExpr e;
            e.coeffs[s_.substr(start, pos_ - start)] = 1.0;
            return e;
        }
        fail("unexpected '" + std::string(1, ch) + "'");
    }

    const std::string& s_;
    std::size_t        pos_ = 0;
};

} // namespace

LinearExpr parse_linear_expr(const std::string& text)
{
    return ExprParser(text).parse();
}

/* ------------------------------------------------------------------------- */
/*  ConstraintMap                                                            */
/* ------------------------------------------------------------------------- */
ConstraintMap::ConstraintMap(const std::vector<std::string>&           names,
                             const std::vector<bool>&                  fixed_zero,
                             const std::map<std::string, std::string>& constraints)
    : names_(names)
{
    const int n = static_cast<int>(names.size());
    std::map<std::string, int> lookup;
    for (int i = 0; i < n; ++i) lookup[names[i]] = i;

    std::vector<LinearExpr> tied(n);
    constrained_.assign(n, false);
    for (const auto& [name, text] : constraints) {
        auto it = lookup.find(name);
        if (it == lookup.end())
            throw ConstraintResolutionError("Constraint on unknown parameter '" + name + "'");
        tied[it->second]        = parse_linear_expr(text);
        constrained_[it->second] = true;
    }

    /* free parameters */
    reduced_.assign(n, -1);
    for (int i = 0; i < n; ++i) {
        const bool fixed = !fixed_zero.empty() && fixed_zero[i];
        if (!constrained_[i] && !fixed) {
            reduced_[i] = static_cast<int>(free_.size());
            free_.push_back(i);
        }
    }

    M_ = Matrix::Zero(n, static_cast<Eigen::Index>(free_.size()));
    k_ = Vector::Zero(n);

    /* resolve every parameter to a row of (M, k) */
    enum class State { Pending, Visiting, Done };
    std::vector<State> state(n, State::Pending);

    std::function<void(int)> resolve = [&](int i) {
        if (state[i] == State::Done) return;
        if (state[i] == State::Visiting)
            throw ConstraintResolutionError("Circular constraint involving '" + names_[i] + "'");
        state[i] = State::Visiting;

        if (reduced_[i] >= 0) {
            M_(i, reduced_[i]) = 1.0;
        } else if (constrained_[i]) {
            k_[i] = tied[i].constant;
            for (const auto& [ref, coeff] : tied[i].coeffs) {
                auto it = lookup.find(ref);
                if (it == lookup.end())
                    throw ConstraintResolutionError("Constraint on '" + names_[i]
                                                    + "' references unknown parameter '" + ref + "'");
                resolve(it->second);
                M_.row(i) += coeff * M_.row(it->second);
                k_[i]     += coeff * k_[it->second];
            }
        }
        /* fixed at zero: row stays zero */
        state[i] = State::Done;
    };

    for (int i = 0; i < n; ++i) resolve(i);
}

Vector ConstraintMap::reduce(const Vector& full) const
{
    Vector u(n_free());
    for (int j = 0; j < n_free(); ++j) u[j] = full[free_[j]];
    return u;
}

} // namespace clumpfit
