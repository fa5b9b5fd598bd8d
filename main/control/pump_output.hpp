#ifndef PUMP_OUTPUT_HPP
#define PUMP_OUTPUT_HPP

// Physical pump drive used by PumpController. The relay driver implements it
// on hardware; tests substitute a recorder.
class PumpOutput {
public:
    virtual ~PumpOutput() = default;
    virtual void drive(bool on) = 0;
};

#endif // PUMP_OUTPUT_HPP
